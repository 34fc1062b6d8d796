#ifndef QTPLAYBACKBACKEND_H
#define QTPLAYBACKBACKEND_H

#include <QMediaPlayer>
#include <QAudioOutput>
#include "core/PlaybackSession.h"

namespace CamCtl {

/**
 * @brief Qt Multimedia-based video file playback
 *
 * Hardware-accelerated decoding through QMediaPlayer. Video goes to a
 * QGraphicsVideoItem (see PlaybackView::videoItem()).
 *
 * Usage:
 *   QtPlaybackBackend* backend = new QtPlaybackBackend();
 *   backend->setVideoOutput(view->videoItem());
 *   PlaybackSession* playback = new PlaybackSession(backend);
 */
class QtPlaybackBackend : public PlaybackBackend {
    Q_OBJECT

public:
    explicit QtPlaybackBackend(QObject* parent = nullptr);
    ~QtPlaybackBackend() override;

    /**
     * @brief Set video output (QGraphicsVideoItem or QVideoWidget)
     */
    void setVideoOutput(QObject* videoOutput);

    void setSource(const QUrl& source) override;
    void play() override;
    void pause() override;
    void stop() override;
    void setPosition(qint64 positionMs) override;

    qint64 position() const override;
    qint64 duration() const override;
    bool isPlaying() const override;

    /**
     * @brief Get the media player (for advanced use)
     */
    QMediaPlayer* mediaPlayer() const { return m_player; }

private slots:
    void onPlaybackStateChanged(QMediaPlayer::PlaybackState state);
    void onMediaStatusChanged(QMediaPlayer::MediaStatus status);
    void onErrorOccurred(QMediaPlayer::Error error, const QString& errorString);

private:
    QMediaPlayer* m_player{nullptr};
    QAudioOutput* m_audioOutput{nullptr};
};

} // namespace CamCtl

#endif // QTPLAYBACKBACKEND_H
