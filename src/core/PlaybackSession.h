#ifndef PLAYBACKSESSION_H
#define PLAYBACKSESSION_H

#include <QObject>
#include <QString>
#include <QTimer>
#include <QUrl>

namespace CamCtl {

/**
 * @brief Playback-only media engine used by the video browser
 */
class PlaybackBackend : public QObject {
    Q_OBJECT

public:
    explicit PlaybackBackend(QObject* parent = nullptr) : QObject(parent) {}
    ~PlaybackBackend() override = default;

    virtual void setSource(const QUrl& source) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void setPosition(qint64 positionMs) = 0;

    virtual qint64 position() const = 0;
    virtual qint64 duration() const = 0;   // <= 0 while unknown
    virtual bool isPlaying() const = 0;

signals:
    void endOfMedia();
    void errorOccurred(const QString& message);
};

/**
 * @brief Transport state for the video browser
 *
 * One backend instance is reused for every file. Position is polled on a
 * timer. While the user drags the seek slider (beginSeek .. endSeek) polling
 * does not report positions, and releasing issues exactly one seek.
 *
 * Usage:
 *   PlaybackSession* playback = new PlaybackSession(new QtPlaybackBackend, 500);
 *   playback->load("/home/user/Videos/video_20240101_120000.mp4");
 *   playback->beginSeek();
 *   playback->endSeek(0.5);
 */
class PlaybackSession : public QObject {
    Q_OBJECT

public:
    /**
     * @param backend Takes ownership
     * @param pollIntervalMs Position polling period
     */
    explicit PlaybackSession(PlaybackBackend* backend, int pollIntervalMs = 500,
                             QObject* parent = nullptr);
    ~PlaybackSession() override;

    /**
     * @brief Load a file, rewind to 0, start playing and polling
     * @return false if the file does not exist
     */
    bool load(const QString& path);

    void play();
    void pause();
    void togglePlayPause();

    /**
     * @brief Fully stop the backend and polling
     */
    void stop();

    /**
     * @brief Seek slider pressed: suspend position reporting
     */
    void beginSeek();

    /**
     * @brief Seek slider released: one seek to fraction x duration
     * @param fraction Clamped to [0, 1]
     */
    void endSeek(double fraction);

    QString currentFile() const { return m_currentFile; }
    bool isPlaying() const { return m_playing; }
    bool isDurationKnown() const { return m_durationKnown; }
    qint64 duration() const { return m_duration; }
    bool isSeekInProgress() const { return m_seekInProgress; }
    bool isPolling() const { return m_pollTimer->isActive(); }
    PlaybackBackend* backend() const { return m_backend; }

    /**
     * @brief Format milliseconds as mm:ss
     */
    static QString formatTime(qint64 ms);

    /**
     * @brief "mm:ss / mm:ss"
     */
    static QString formatProgress(qint64 positionMs, qint64 durationMs);

public slots:
    /**
     * @brief One polling step (driven by the timer)
     */
    void poll();

signals:
    void positionChanged(qint64 positionMs, qint64 durationMs);
    void durationChanged(qint64 durationMs);
    void playingChanged(bool playing);
    void errorOccurred(const QString& message);

private slots:
    void onEndOfMedia();
    void onBackendError(const QString& message);

private:
    void setPlaying(bool playing);

    PlaybackBackend* m_backend;
    QTimer* m_pollTimer;

    QString m_currentFile;
    bool m_playing{false};
    bool m_durationKnown{false};
    qint64 m_duration{0};
    bool m_seekInProgress{false};
};

} // namespace CamCtl

#endif // PLAYBACKSESSION_H
