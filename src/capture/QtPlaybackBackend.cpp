#include "QtPlaybackBackend.h"
#include <QDebug>

namespace CamCtl {

QtPlaybackBackend::QtPlaybackBackend(QObject* parent)
    : PlaybackBackend(parent)
{
    qDebug() << "=== QtPlaybackBackend::Constructor ===";

    m_player = new QMediaPlayer(this);
    m_audioOutput = new QAudioOutput(this);
    m_player->setAudioOutput(m_audioOutput);

    connect(m_player, &QMediaPlayer::playbackStateChanged,
            this, &QtPlaybackBackend::onPlaybackStateChanged);
    connect(m_player, &QMediaPlayer::mediaStatusChanged,
            this, &QtPlaybackBackend::onMediaStatusChanged);
    connect(m_player, &QMediaPlayer::errorOccurred,
            this, &QtPlaybackBackend::onErrorOccurred);

    connect(m_player, &QMediaPlayer::hasVideoChanged, this, [](bool hasVideo) {
        qDebug() << "QtPlaybackBackend: hasVideo:" << hasVideo;
    });
}

QtPlaybackBackend::~QtPlaybackBackend() {
    if (m_player->playbackState() != QMediaPlayer::StoppedState) {
        m_player->stop();
    }
}

void QtPlaybackBackend::setVideoOutput(QObject* videoOutput) {
    qDebug() << "QtPlaybackBackend::setVideoOutput" << videoOutput;
    m_player->setVideoOutput(videoOutput);
}

void QtPlaybackBackend::setSource(const QUrl& source) {
    qDebug() << "QtPlaybackBackend::setSource" << source;
    m_player->setSource(source);
}

void QtPlaybackBackend::play() {
    m_player->play();
}

void QtPlaybackBackend::pause() {
    m_player->pause();
}

void QtPlaybackBackend::stop() {
    if (m_player->playbackState() != QMediaPlayer::StoppedState) {
        qDebug() << "QtPlaybackBackend: Stopping playback";
        m_player->stop();
    }
}

void QtPlaybackBackend::setPosition(qint64 positionMs) {
    m_player->setPosition(positionMs);
}

qint64 QtPlaybackBackend::position() const {
    return m_player->position();
}

qint64 QtPlaybackBackend::duration() const {
    return m_player->duration();
}

bool QtPlaybackBackend::isPlaying() const {
    return m_player->playbackState() == QMediaPlayer::PlayingState;
}

void QtPlaybackBackend::onPlaybackStateChanged(QMediaPlayer::PlaybackState state) {
    QString stateStr;
    switch (state) {
        case QMediaPlayer::StoppedState: stateStr = "Stopped"; break;
        case QMediaPlayer::PlayingState: stateStr = "Playing"; break;
        case QMediaPlayer::PausedState: stateStr = "Paused"; break;
    }
    qDebug() << "QtPlaybackBackend: State" << stateStr;
}

void QtPlaybackBackend::onMediaStatusChanged(QMediaPlayer::MediaStatus status) {
    switch (status) {
        case QMediaPlayer::LoadedMedia:
            qDebug() << "QtPlaybackBackend: Media loaded, duration" << m_player->duration() << "ms";
            break;

        case QMediaPlayer::EndOfMedia:
            qDebug() << "QtPlaybackBackend: End of media";
            emit endOfMedia();
            break;

        case QMediaPlayer::InvalidMedia:
            qWarning() << "QtPlaybackBackend: Invalid media" << m_player->source();
            break;

        default:
            break;
    }
}

void QtPlaybackBackend::onErrorOccurred(QMediaPlayer::Error error, const QString& errorString) {
    QString errorType;
    switch (error) {
        case QMediaPlayer::NoError: errorType = "NoError"; break;
        case QMediaPlayer::ResourceError: errorType = "ResourceError"; break;
        case QMediaPlayer::FormatError: errorType = "FormatError"; break;
        case QMediaPlayer::NetworkError: errorType = "NetworkError"; break;
        case QMediaPlayer::AccessDeniedError: errorType = "AccessDeniedError"; break;
    }
    qWarning() << "QtPlaybackBackend: Error" << errorType << "-" << errorString;

    if (error != QMediaPlayer::NoError) {
        emit errorOccurred(errorString);
    }
}

} // namespace CamCtl
