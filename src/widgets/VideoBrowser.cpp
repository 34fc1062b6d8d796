#include "VideoBrowser.h"
#include "PlaybackView.h"
#include "core/PlaybackSession.h"
#include "utils/MediaLibrary.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QDir>
#include <QFileInfo>
#include <QDebug>

namespace CamCtl {

VideoBrowser::VideoBrowser(const QString& directory, PlaybackSession* playback, QWidget* parent)
    : QWidget(parent)
    , m_directory(directory)
    , m_playback(playback)
{
    setupUi();

    connect(m_playback, &PlaybackSession::positionChanged,
            this, &VideoBrowser::onPositionChanged);
    connect(m_playback, &PlaybackSession::playingChanged,
            this, &VideoBrowser::onPlayingChanged);
    connect(m_playback, &PlaybackSession::errorOccurred,
            this, &VideoBrowser::onPlaybackError);
}

void VideoBrowser::setupUi() {
    setObjectName("videoBrowser");

    QHBoxLayout* mainLayout = new QHBoxLayout(this);
    mainLayout->setContentsMargins(8, 8, 8, 8);
    mainLayout->setSpacing(8);

    m_list = new QListWidget(this);
    m_list->setObjectName("mediaList");
    m_list->setMaximumWidth(280);
    connect(m_list, &QListWidget::currentRowChanged,
            this, &VideoBrowser::onCurrentRowChanged);

    QVBoxLayout* playerLayout = new QVBoxLayout();
    playerLayout->setSpacing(6);

    m_playbackView = new PlaybackView(this);
    m_playbackView->setObjectName("videoDisplay");

    // Transport
    QHBoxLayout* transportLayout = new QHBoxLayout();

    m_playPauseButton = new QPushButton("Play", this);
    m_playPauseButton->setObjectName("playPauseButton");
    m_playPauseButton->setCursor(Qt::PointingHandCursor);
    m_playPauseButton->setFixedWidth(80);
    connect(m_playPauseButton, &QPushButton::clicked, this, &VideoBrowser::onPlayPauseClicked);

    m_seekSlider = new QSlider(Qt::Horizontal, this);
    m_seekSlider->setObjectName("seekSlider");
    m_seekSlider->setRange(0, SliderRange);
    m_seekSlider->setTracking(false);
    connect(m_seekSlider, &QSlider::sliderPressed, this, &VideoBrowser::onSliderPressed);
    connect(m_seekSlider, &QSlider::sliderReleased, this, &VideoBrowser::onSliderReleased);
    connect(m_seekSlider, &QSlider::sliderMoved, this, &VideoBrowser::onSliderMoved);

    m_timeLabel = new QLabel(PlaybackSession::formatProgress(0, 0), this);
    m_timeLabel->setObjectName("timeLabel");

    transportLayout->addWidget(m_playPauseButton);
    transportLayout->addWidget(m_seekSlider, 1);
    transportLayout->addWidget(m_timeLabel);

    m_statusLabel = new QLabel(this);
    m_statusLabel->setObjectName("statusLabel");

    playerLayout->addWidget(m_playbackView, 1);
    playerLayout->addLayout(transportLayout);
    playerLayout->addWidget(m_statusLabel);

    mainLayout->addWidget(m_list);
    mainLayout->addLayout(playerLayout, 1);
}

void VideoBrowser::refresh() {
    const QString selectedName = m_list->currentItem() ? m_list->currentItem()->text() : QString();
    const QStringList entries = MediaLibrary::listEntries(m_directory, MediaLibrary::videoExtensions());

    // Re-selecting must not restart playback
    m_list->blockSignals(true);
    m_list->clear();
    m_list->addItems(entries);
    const int row = entries.indexOf(selectedName);
    if (row >= 0) {
        m_list->setCurrentRow(row);
    }
    m_list->blockSignals(false);

    qDebug() << "VideoBrowser: Listed" << entries.size() << "videos in" << m_directory;
}

void VideoBrowser::stopPlayback() {
    m_playback->stop();
    m_playbackView->clear();
    m_seekSlider->setValue(0);
}

void VideoBrowser::onCurrentRowChanged(int row) {
    if (row < 0) {
        return;
    }

    const QString path = QDir(m_directory).absoluteFilePath(m_list->item(row)->text());
    m_statusLabel->clear();
    m_seekSlider->setValue(0);
    m_timeLabel->setText(PlaybackSession::formatProgress(0, 0));
    m_playbackView->showVideo();

    if (m_playback->load(path)) {
        m_statusLabel->setText(QFileInfo(path).fileName());
    }
}

void VideoBrowser::onPlayPauseClicked() {
    m_playback->togglePlayPause();
}

void VideoBrowser::onSliderPressed() {
    m_playback->beginSeek();
}

void VideoBrowser::onSliderReleased() {
    m_playback->endSeek(static_cast<double>(m_seekSlider->sliderPosition()) / SliderRange);
}

void VideoBrowser::onSliderMoved(int value) {
    if (!m_playback->isDurationKnown()) {
        return;
    }
    const qint64 target = m_playback->duration() * value / SliderRange;
    m_timeLabel->setText(PlaybackSession::formatProgress(target, m_playback->duration()));
}

void VideoBrowser::onPositionChanged(qint64 positionMs, qint64 durationMs) {
    if (m_seekSlider->isSliderDown()) {
        return;
    }

    const int value = durationMs > 0
        ? static_cast<int>(qBound<qint64>(0, positionMs * SliderRange / durationMs, SliderRange))
        : 0;
    m_seekSlider->setValue(value);
    m_timeLabel->setText(PlaybackSession::formatProgress(positionMs, durationMs));
}

void VideoBrowser::onPlayingChanged(bool playing) {
    m_playPauseButton->setText(playing ? "Pause" : "Play");
}

void VideoBrowser::onPlaybackError(const QString& message) {
    m_statusLabel->setText(QString("Playback error: %1").arg(message));
}

} // namespace CamCtl
