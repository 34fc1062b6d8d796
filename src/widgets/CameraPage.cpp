#include "CameraPage.h"
#include "DisplayEmbedder.h"
#include "core/CaptureSession.h"
#include "core/Config.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFileInfo>
#include <QStyle>
#include <QDebug>

namespace CamCtl {

CameraPage::CameraPage(CaptureSession* session, DeviceDetector* detector,
                       QWidget* appWindow, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
    , m_deviceDetector(detector)
{
    setupUi();

    m_embedder = new DisplayEmbedder(appWindow, m_previewContainer, this);

    m_elapsedTimer = new QTimer(this);
    m_elapsedTimer->setInterval(1000);
    connect(m_elapsedTimer, &QTimer::timeout, this, &CameraPage::updateElapsedLabel);

    connect(m_session, &CaptureSession::modeChanged, this, &CameraPage::onModeChanged);
    connect(m_session, &CaptureSession::recordingStarted, this, &CameraPage::onRecordingStarted);
    connect(m_session, &CaptureSession::recordingFinished, this, &CameraPage::onRecordingFinished);
    connect(m_session, &CaptureSession::photoCaptured, this, &CameraPage::onPhotoCaptured);
    connect(m_session, &CaptureSession::errorOccurred, this, &CameraPage::onErrorOccurred);
    connect(m_session, &CaptureSession::displayWidgetReady, this, &CameraPage::onDisplayWidgetReady);
    connect(m_session, &CaptureSession::displayWidgetReleased, this, &CameraPage::onDisplayWidgetReleased);

    if (m_deviceDetector) {
        connect(m_deviceDetector, &DeviceDetector::deviceAdded, this, &CameraPage::onDeviceAdded);
        connect(m_deviceDetector, &DeviceDetector::deviceRemoved, this, &CameraPage::onDeviceRemoved);
        connect(m_deviceDetector, &DeviceDetector::devicesChanged,
                this, [this](const QList<DeviceInfo>&) { refreshSourceList(); });
    }

    refreshSourceList();
    updateButtons();
}

CameraPage::~CameraPage() {
    m_elapsedTimer->stop();
}

void CameraPage::setupUi() {
    setObjectName("cameraPage");

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(8, 8, 8, 8);
    mainLayout->setSpacing(8);

    // Preview area
    m_previewContainer = new QFrame(this);
    m_previewContainer->setObjectName("previewContainer");
    m_previewContainer->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    m_previewContainer->setMinimumSize(320, 180);

    QVBoxLayout* previewLayout = new QVBoxLayout(m_previewContainer);
    previewLayout->setContentsMargins(0, 0, 0, 0);
    previewLayout->setSpacing(0);

    m_placeholderLabel = new QLabel("No preview", m_previewContainer);
    m_placeholderLabel->setObjectName("placeholderLabel");
    m_placeholderLabel->setAlignment(Qt::AlignCenter);
    previewLayout->addWidget(m_placeholderLabel);

    mainLayout->addWidget(m_previewContainer, 1);

    // Controls
    QHBoxLayout* controlsLayout = new QHBoxLayout();
    controlsLayout->setSpacing(10);

    m_sourceSelector = new QComboBox(this);
    m_sourceSelector->setObjectName("sourceSelector");
    m_sourceSelector->setCursor(Qt::PointingHandCursor);
    m_sourceSelector->setMinimumWidth(220);
    connect(m_sourceSelector, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &CameraPage::onSourceSelectorChanged);

    m_previewButton = new QPushButton("Preview", this);
    m_photoButton = new QPushButton("Photo", this);
    m_recordButton = new QPushButton("Record", this);
    m_recordButton->setObjectName("recordButton");

    for (QPushButton* button : {m_previewButton, m_photoButton, m_recordButton}) {
        button->setCursor(Qt::PointingHandCursor);
        button->setMinimumHeight(36);
    }

    connect(m_previewButton, &QPushButton::clicked, this, &CameraPage::onPreviewClicked);
    connect(m_photoButton, &QPushButton::clicked, this, &CameraPage::onPhotoClicked);
    connect(m_recordButton, &QPushButton::clicked, this, &CameraPage::onRecordClicked);

    controlsLayout->addWidget(m_sourceSelector);
    controlsLayout->addWidget(m_previewButton, 1);
    controlsLayout->addWidget(m_photoButton, 1);
    controlsLayout->addWidget(m_recordButton, 1);
    mainLayout->addLayout(controlsLayout);

    // Status line
    QHBoxLayout* statusLayout = new QHBoxLayout();

    m_statusLabel = new QLabel("Idle", this);
    m_statusLabel->setObjectName("statusLabel");

    m_elapsedLabel = new QLabel("REC 00:00:00", this);
    m_elapsedLabel->setObjectName("elapsedLabel");
    m_elapsedLabel->setVisible(false);

    statusLayout->addWidget(m_statusLabel, 1);
    statusLayout->addWidget(m_elapsedLabel);
    mainLayout->addLayout(statusLayout);
}

void CameraPage::refreshSourceList() {
    const QString current = m_session->cameraSource();

    m_sourceSelector->blockSignals(true);
    m_sourceSelector->clear();
    m_sourceItems.clear();

    m_sourceItems.append({"auto", "Auto"});
    if (m_session->capabilities().hasLibcameraSource) {
        m_sourceItems.append({"libcamera", "libcamera"});
    }
    if (m_deviceDetector) {
        for (const DeviceInfo& device : m_deviceDetector->lastKnownDevices()) {
            m_sourceItems.append({device.sourceId(),
                                  QString("%1 (%2)").arg(device.name, device.devicePath)});
        }
    }
    m_sourceItems.append({"test", "Test pattern"});

    int selected = 0;
    for (int i = 0; i < m_sourceItems.size(); ++i) {
        m_sourceSelector->addItem(m_sourceItems[i].displayText);
        if (m_sourceItems[i].source == current) {
            selected = i;
        }
    }

    // Keep a configured device that is currently unplugged selectable
    if (m_sourceItems[selected].source != current && !current.isEmpty()) {
        m_sourceItems.append({current, QString("%1 (not found)").arg(current)});
        m_sourceSelector->addItem(m_sourceItems.last().displayText);
        selected = m_sourceItems.size() - 1;
    }

    m_sourceSelector->setCurrentIndex(selected);
    m_sourceSelector->blockSignals(false);
}

void CameraPage::onPreviewClicked() {
    qDebug() << "CameraPage: Preview clicked";
    if (m_session->startPreview()) {
        updateStatusLabel("Preview started");
    }
}

void CameraPage::onPhotoClicked() {
    qDebug() << "CameraPage: Photo clicked";
    m_session->captureStill();
}

void CameraPage::onRecordClicked() {
    qDebug() << "CameraPage: Record clicked";
    if (m_session->isRecording()) {
        if (m_session->isFinalizing()) {
            return;
        }
        updateStatusLabel("Finalizing recording...");
    }
    m_session->toggleRecording();
    updateButtons();
}

void CameraPage::onSourceSelectorChanged(int index) {
    if (index < 0 || index >= m_sourceItems.size()) {
        return;
    }

    const QString source = m_sourceItems[index].source;
    if (source == m_session->cameraSource()) {
        return;
    }

    m_session->setCameraSource(source);

    CameraConfig camera = Config::instance().camera();
    camera.source = source;
    Config::instance().setCamera(camera);

    // A running recording keeps its source until it is stopped
    if (m_session->mode() == CaptureMode::Preview) {
        m_session->startPreview();
    }
    updateStatusLabel(QString("Camera source: %1").arg(m_sourceItems[index].displayText));
}

void CameraPage::onModeChanged(CaptureMode mode) {
    qDebug() << "CameraPage: Mode" << captureModeName(mode);
    if (mode == CaptureMode::Idle) {
        updateStatusLabel("Idle");
    } else if (mode == CaptureMode::Preview) {
        updateStatusLabel("Previewing");
    }
    updateButtons();
}

void CameraPage::onRecordingStarted(const QString& path) {
    updateStatusLabel(QString("Recording to %1").arg(QFileInfo(path).fileName()));

    m_recordClock.start();
    m_elapsedLabel->setText("REC 00:00:00");
    m_elapsedLabel->setVisible(true);
    m_elapsedTimer->start();
    updateButtons();
}

void CameraPage::onRecordingFinished(const QString& path) {
    m_elapsedTimer->stop();
    m_elapsedLabel->setVisible(false);
    updateStatusLabel(QString("Video saved to %1").arg(path));
    updateButtons();
}

void CameraPage::onPhotoCaptured(const QString& path) {
    updateStatusLabel(QString("Photo saved to %1").arg(path));
}

void CameraPage::onErrorOccurred(const QString& message) {
    updateStatusLabel(message, true);
    updateButtons();
}

void CameraPage::onDisplayWidgetReady(QWidget* widget) {
    m_placeholderLabel->hide();
    m_embedder->embed(widget);
}

void CameraPage::onDisplayWidgetReleased(QWidget* widget) {
    m_embedder->detach(widget);
    m_placeholderLabel->show();
}

void CameraPage::onDeviceAdded(const DeviceInfo& device) {
    updateStatusLabel(QString("Camera connected: %1 (%2)").arg(device.name, device.devicePath));
}

void CameraPage::onDeviceRemoved(const DeviceInfo& device) {
    // Only worth an error if the running pipeline reads from it
    const bool inUse = device.sourceId() == m_session->cameraSource()
                       && m_session->mode() != CaptureMode::Idle;
    updateStatusLabel(QString("Camera disconnected: %1 (%2)").arg(device.name, device.devicePath), inUse);
}

void CameraPage::updateElapsedLabel() {
    const qint64 totalSeconds = m_recordClock.elapsed() / 1000;
    m_elapsedLabel->setText(QString("REC %1:%2:%3")
                                .arg(totalSeconds / 3600, 2, 10, QChar('0'))
                                .arg((totalSeconds / 60) % 60, 2, 10, QChar('0'))
                                .arg(totalSeconds % 60, 2, 10, QChar('0')));
}

void CameraPage::updateStatusLabel(const QString& text, bool error) {
    m_statusLabel->setText(text);
    m_statusLabel->setProperty("error", error);
    // Re-evaluate the [error="true"] selector
    m_statusLabel->style()->unpolish(m_statusLabel);
    m_statusLabel->style()->polish(m_statusLabel);
}

void CameraPage::updateButtons() {
    const bool recording = m_session->isRecording();
    m_recordButton->setText(recording ? "Stop" : "Record");
    m_recordButton->setProperty("recording", recording);
    m_recordButton->style()->unpolish(m_recordButton);
    m_recordButton->style()->polish(m_recordButton);
    m_recordButton->setEnabled(!m_session->isFinalizing());
}

} // namespace CamCtl
