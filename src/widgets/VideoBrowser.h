#ifndef VIDEOBROWSER_H
#define VIDEOBROWSER_H

#include <QWidget>
#include <QListWidget>
#include <QLabel>
#include <QPushButton>
#include <QSlider>

namespace CamCtl {

class PlaybackSession;
class PlaybackView;

/**
 * @brief Videos tab: file list plus a playback transport
 *
 * The seek slider spans 0..SliderRange. While it is held down the poll
 * driven position updates are ignored.
 */
class VideoBrowser : public QWidget {
    Q_OBJECT

public:
    static constexpr int SliderRange = 1000;

    VideoBrowser(const QString& directory, PlaybackSession* playback, QWidget* parent = nullptr);

    /**
     * @brief Re-scan the video directory
     */
    void refresh();

    /**
     * @brief Stop playback completely (tab hidden)
     */
    void stopPlayback();

    PlaybackView* playbackView() const { return m_playbackView; }

private slots:
    void onCurrentRowChanged(int row);
    void onPlayPauseClicked();
    void onSliderPressed();
    void onSliderReleased();
    void onSliderMoved(int value);
    void onPositionChanged(qint64 positionMs, qint64 durationMs);
    void onPlayingChanged(bool playing);
    void onPlaybackError(const QString& message);

private:
    void setupUi();

    QString m_directory;
    PlaybackSession* m_playback;

    QListWidget* m_list;
    PlaybackView* m_playbackView;
    QPushButton* m_playPauseButton;
    QSlider* m_seekSlider;
    QLabel* m_timeLabel;
    QLabel* m_statusLabel;
};

} // namespace CamCtl

#endif // VIDEOBROWSER_H
