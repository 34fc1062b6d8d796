#include "PlaybackSession.h"
#include <QFileInfo>
#include <QDebug>

namespace CamCtl {

PlaybackSession::PlaybackSession(PlaybackBackend* backend, int pollIntervalMs, QObject* parent)
    : QObject(parent)
    , m_backend(backend)
{
    if (m_backend) {
        m_backend->setParent(this);
        connect(m_backend, &PlaybackBackend::endOfMedia,
                this, &PlaybackSession::onEndOfMedia);
        connect(m_backend, &PlaybackBackend::errorOccurred,
                this, &PlaybackSession::onBackendError);
    }

    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(qMax(50, pollIntervalMs));
    connect(m_pollTimer, &QTimer::timeout, this, &PlaybackSession::poll);
}

PlaybackSession::~PlaybackSession() {
    m_pollTimer->stop();
    if (m_backend) {
        m_backend->stop();
    }
}

bool PlaybackSession::load(const QString& path) {
    qDebug() << "=== PlaybackSession::load ===" << path;

    if (!m_backend) {
        emit errorOccurred("No playback backend");
        return false;
    }

    if (!QFileInfo::exists(path)) {
        qWarning() << "  File not found:" << path;
        emit errorOccurred(QString("File not found: %1").arg(path));
        return false;
    }

    m_backend->stop();

    m_currentFile = path;
    m_durationKnown = false;
    m_duration = 0;
    m_seekInProgress = false;

    m_backend->setSource(QUrl::fromLocalFile(path));
    m_backend->setPosition(0);
    m_backend->play();
    setPlaying(true);

    m_pollTimer->start();
    return true;
}

void PlaybackSession::play() {
    if (!m_backend || m_currentFile.isEmpty()) {
        return;
    }
    m_backend->play();
    setPlaying(true);
    m_pollTimer->start();
}

void PlaybackSession::pause() {
    if (!m_backend || m_currentFile.isEmpty()) {
        return;
    }
    m_backend->pause();
    setPlaying(false);
}

void PlaybackSession::togglePlayPause() {
    if (m_playing) {
        pause();
    } else {
        play();
    }
}

void PlaybackSession::stop() {
    m_pollTimer->stop();
    m_seekInProgress = false;
    if (m_backend) {
        m_backend->stop();
    }
    setPlaying(false);
}

void PlaybackSession::beginSeek() {
    m_seekInProgress = true;
}

void PlaybackSession::endSeek(double fraction) {
    if (!m_seekInProgress) {
        qDebug() << "PlaybackSession: endSeek without beginSeek";
    }
    m_seekInProgress = false;

    if (!m_backend || !m_durationKnown || m_duration <= 0) {
        qDebug() << "PlaybackSession: Duration unknown, seek ignored";
        return;
    }

    const double clamped = qBound(0.0, fraction, 1.0);
    const qint64 target = qRound64(clamped * static_cast<double>(m_duration));

    qDebug() << "PlaybackSession: Seek to" << target << "ms";
    m_backend->setPosition(target);
    emit positionChanged(target, m_duration);
}

void PlaybackSession::poll() {
    if (!m_backend || m_currentFile.isEmpty()) {
        return;
    }

    const qint64 backendDuration = m_backend->duration();
    if (backendDuration > 0 && (!m_durationKnown || backendDuration != m_duration)) {
        m_durationKnown = true;
        m_duration = backendDuration;
        emit durationChanged(m_duration);
    }

    // The slider belongs to the user while dragging
    if (m_seekInProgress) {
        return;
    }

    emit positionChanged(m_backend->position(), m_duration);
}

QString PlaybackSession::formatTime(qint64 ms) {
    const qint64 totalSeconds = qMax<qint64>(0, ms) / 1000;
    return QString("%1:%2")
        .arg(totalSeconds / 60, 2, 10, QChar('0'))
        .arg(totalSeconds % 60, 2, 10, QChar('0'));
}

QString PlaybackSession::formatProgress(qint64 positionMs, qint64 durationMs) {
    return QString("%1 / %2").arg(formatTime(positionMs), formatTime(durationMs));
}

void PlaybackSession::onEndOfMedia() {
    qDebug() << "PlaybackSession: End of media" << m_currentFile;
    poll();
    m_pollTimer->stop();
    setPlaying(false);
}

void PlaybackSession::onBackendError(const QString& message) {
    qWarning() << "PlaybackSession: Playback error:" << message;
    m_pollTimer->stop();
    setPlaying(false);
    emit errorOccurred(message);
}

void PlaybackSession::setPlaying(bool playing) {
    if (m_playing == playing) {
        return;
    }
    m_playing = playing;
    emit playingChanged(playing);
}

} // namespace CamCtl
