#include "CaptureSession.h"
#include "utils/MediaPaths.h"
#include <QSaveFile>
#include <QWidget>
#include <QDebug>
#include <cstdlib>

namespace CamCtl {

CaptureSettings CaptureSettings::fromConfig(const StorageConfig& storage, const TimingConfig& timing) {
    CaptureSettings settings;
    settings.photoDirectory = storage.photoDirectory;
    settings.videoDirectory = storage.videoDirectory;
    settings.stillTimeoutMs = timing.stillTimeoutMs;
    settings.stopFallbackMs = timing.stopFallbackMs;
    return settings;
}

CaptureSession::CaptureSession(MediaEngine* engine, const PipelineBuilder& builder,
                               const CaptureSettings& settings, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_builder(builder)
    , m_settings(settings)
    , m_debugDescriptions(std::getenv("CAMCTL_DEBUG") != nullptr)
{
    qRegisterMetaType<CamCtl::CaptureMode>("CamCtl::CaptureMode");
    qRegisterMetaType<CamCtl::SessionEvent>("CamCtl::SessionEvent");

    m_bridge = new EventBridge(this);
    connect(m_bridge, &EventBridge::sessionEvent,
            this, &CaptureSession::handleEvent);

    // Fallback for a record pipeline that never reports end-of-stream
    m_stopTimer = new QTimer(this);
    m_stopTimer->setSingleShot(true);
    connect(m_stopTimer, &QTimer::timeout,
            this, &CaptureSession::onStopTimeout);
}

CaptureSession::~CaptureSession() {
    m_stopTimer->stop();
    m_bridge->detach();
    if (m_pipeline) {
        m_pipeline->stop();
        m_pipeline.reset();
    }
}

bool CaptureSession::startPreview() {
    SessionEvent event;
    event.type = SessionEvent::Type::StartPreview;
    handleEvent(event);
    return m_mode == CaptureMode::Preview;
}

bool CaptureSession::startRecording() {
    SessionEvent event;
    event.type = SessionEvent::Type::StartRecording;
    handleEvent(event);
    return m_mode == CaptureMode::Record;
}

void CaptureSession::toggleRecording() {
    SessionEvent event;
    event.type = SessionEvent::Type::ToggleRecord;
    handleEvent(event);
}

void CaptureSession::stop() {
    SessionEvent event;
    event.type = SessionEvent::Type::StopRequested;
    handleEvent(event);
}

void CaptureSession::setCameraSource(const QString& source) {
    qDebug() << "CaptureSession: Camera source set to" << source;
    m_builder.setCameraSource(source);
}

void CaptureSession::handleEvent(const SessionEvent& event) {
    if (event.generation != 0 && event.generation != m_generation) {
        qDebug() << "CaptureSession: Ignoring stale" << SessionEvent::typeName(event.type)
                 << "from generation" << event.generation << "(current" << m_generation << ")";
        return;
    }

    switch (event.type) {
        case SessionEvent::Type::StartPreview:
            startPipeline(CaptureMode::Preview);
            break;

        case SessionEvent::Type::StartRecording:
            if (m_mode == CaptureMode::Record) {
                qDebug() << "CaptureSession: Already recording";
            } else {
                startPipeline(CaptureMode::Record);
            }
            break;

        case SessionEvent::Type::ToggleRecord:
            if (m_mode == CaptureMode::Record) {
                requestGracefulStop();
            } else {
                startPipeline(CaptureMode::Record);
            }
            break;

        case SessionEvent::Type::StopRequested:
            teardown();
            break;

        case SessionEvent::Type::EngineError:
            qWarning() << "CaptureSession: Pipeline error:" << event.detail;
            teardown();
            emit errorOccurred(event.detail);
            break;

        case SessionEvent::Type::EndOfStream:
            qDebug() << "CaptureSession: End of stream, recording finalized";
            teardown();
            break;

        case SessionEvent::Type::StopTimeout:
            qWarning() << "CaptureSession: No end-of-stream within" << m_settings.stopFallbackMs
                       << "ms, forcing stop";
            teardown();
            startPipeline(CaptureMode::Preview);
            break;

        case SessionEvent::Type::PipelineStarted:
            if (m_pipeline) {
                // Re-assert embedding now that the sink has realized its window
                if (QWidget* widget = m_pipeline->displayWidget()) {
                    emit displayWidgetReady(widget);
                }
            }
            emit pipelineStarted();
            break;
    }
}

bool CaptureSession::captureStill() {
    qDebug() << "=== CaptureSession::captureStill ===";

    if (!m_pipeline || m_mode == CaptureMode::Idle) {
        qWarning() << "  No active pipeline. Start preview or recording first.";
        emit errorOccurred("No active pipeline. Start preview or recording first.");
        return false;
    }

    QByteArray data;
    if (!m_pipeline->pullStill(m_settings.stillTimeoutMs, data) || data.isEmpty()) {
        qWarning() << "  No still sample within" << m_settings.stillTimeoutMs << "ms";
        emit errorOccurred("Failed to capture photo sample");
        return false;
    }

    if (!MediaPaths::ensureDirectoryExists(m_settings.photoDirectory)) {
        emit errorOccurred(QString("Failed to create photo directory: %1").arg(m_settings.photoDirectory));
        return false;
    }

    const QString path = MediaPaths::outputPath(m_settings.photoDirectory, MediaKind::Photo);
    if (!writePhoto(path, data)) {
        emit errorOccurred(QString("Failed to write photo: %1").arg(path));
        return false;
    }

    qDebug() << "  Photo saved to" << path << "(" << data.size() << "bytes )";
    emit photoCaptured(path);
    return true;
}

bool CaptureSession::startPipeline(CaptureMode mode) {
    qDebug() << "=== CaptureSession::startPipeline ===" << captureModeName(mode);

    if (!m_engine) {
        emit errorOccurred("No media engine available");
        return false;
    }

    GraphDescriptor graph;
    if (mode == CaptureMode::Record) {
        if (!MediaPaths::ensureDirectoryExists(m_settings.videoDirectory)) {
            emit errorOccurred(QString("Failed to create video directory: %1").arg(m_settings.videoDirectory));
            return false;
        }
        graph = m_builder.buildRecordGraph(
            MediaPaths::outputPath(m_settings.videoDirectory, MediaKind::Video));
    } else {
        graph = m_builder.buildPreviewGraph();
    }

    if (m_debugDescriptions) {
        qDebug() << "  Launch description:" << graph.launchDescription;
    }

    QString error;
    std::unique_ptr<Pipeline> pipeline = m_engine->createPipeline(graph, &error);
    if (!pipeline) {
        qCritical() << "  Failed to build" << captureModeName(mode) << "pipeline:" << error;
        emit errorOccurred(QString("Failed to build %1 pipeline: %2")
                               .arg(captureModeName(mode), error));
        return false;
    }

    // Constructed graphs do not hold the camera yet. Release the current one
    // before the new one starts so only one pipeline is ever live.
    teardown();

    m_pipeline = std::move(pipeline);
    ++m_generation;
    m_bridge->attach(m_pipeline.get(), m_generation);

    // The display widget must be in the window before the sink binds to it
    if (QWidget* widget = m_pipeline->displayWidget()) {
        emit displayWidgetReady(widget);
    }

    if (!m_pipeline->play()) {
        qCritical() << "  Failed to set pipeline to PLAYING";
        teardown();
        emit errorOccurred(QString("Failed to start %1 pipeline").arg(captureModeName(mode)));
        return false;
    }

    if (mode == CaptureMode::Record) {
        m_currentVideoPath = graph.outputPath;
    }
    setMode(mode);

    if (mode == CaptureMode::Record) {
        qDebug() << "  Recording to" << m_currentVideoPath;
        emit recordingStarted(m_currentVideoPath);
    }
    return true;
}

void CaptureSession::requestGracefulStop() {
    if (m_finalizing) {
        qDebug() << "CaptureSession: Stop already in progress";
        return;
    }

    qDebug() << "CaptureSession: Sending end-of-stream to finalize" << m_currentVideoPath;

    if (!m_pipeline || !m_pipeline->sendEndOfStream()) {
        qWarning() << "CaptureSession: Could not send end-of-stream, forcing stop";
        teardown();
        startPipeline(CaptureMode::Preview);
        return;
    }

    m_finalizing = true;
    m_stopGeneration = m_generation;
    m_stopTimer->start(m_settings.stopFallbackMs);
}

void CaptureSession::onStopTimeout() {
    SessionEvent event;
    event.type = SessionEvent::Type::StopTimeout;
    event.generation = m_stopGeneration;
    handleEvent(event);
}

void CaptureSession::teardown() {
    m_stopTimer->stop();
    m_finalizing = false;

    if (m_pipeline) {
        m_bridge->detach();
        m_pipeline->stop();

        if (QWidget* widget = m_pipeline->displayWidget()) {
            emit displayWidgetReleased(widget);
        }

        // May be inside the pipeline's own signal emission
        m_pipeline.release()->deleteLater();
    }

    const bool wasRecording = m_mode == CaptureMode::Record;
    const QString finishedPath = m_currentVideoPath;
    m_currentVideoPath.clear();

    setMode(CaptureMode::Idle);

    if (wasRecording) {
        qDebug() << "CaptureSession: Recording finished" << finishedPath;
        emit recordingFinished(finishedPath);
    }
}

void CaptureSession::setMode(CaptureMode mode) {
    if (m_mode == mode) {
        return;
    }
    qDebug() << "CaptureSession: Mode" << captureModeName(m_mode) << "->" << captureModeName(mode);
    m_mode = mode;
    emit modeChanged(mode);
}

bool CaptureSession::writePhoto(const QString& path, const QByteArray& data) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "CaptureSession: Cannot open" << path << ":" << file.errorString();
        return false;
    }

    if (file.write(data) != data.size()) {
        qWarning() << "CaptureSession: Short write to" << path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qWarning() << "CaptureSession: Commit failed for" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

} // namespace CamCtl
