#ifndef CAPTURESESSION_H
#define CAPTURESESSION_H

#include <QObject>
#include <QString>
#include <QTimer>
#include <memory>
#include "core/MediaEngine.h"
#include "core/PipelineBuilder.h"
#include "core/EventBridge.h"

class QWidget;

namespace CamCtl {

/**
 * @brief Output locations and timeouts used by the session
 */
struct CaptureSettings {
    QString photoDirectory;
    QString videoDirectory;
    int stillTimeoutMs = 1000;
    int stopFallbackMs = 5000;

    static CaptureSettings fromConfig(const StorageConfig& storage, const TimingConfig& timing);
};

/**
 * @brief Owns the single live capture pipeline and its lifecycle
 *
 * States: Idle -> Preview -> Record -> (graceful stop) -> Idle.
 *
 * Every transition goes through handleEvent(). A new graph is constructed
 * first, then the current pipeline is torn down before the new one plays,
 * so at most one pipeline is ever owned. If construction fails the session
 * keeps its current pipeline and mode.
 *
 * Stopping a recording posts end-of-stream and arms a fallback timer.
 * If the end-of-stream notification arrives first the session goes Idle.
 * If the timer fires first the pipeline is forced down and preview resumes.
 *
 * Usage:
 *   CaptureSession* session = new CaptureSession(engine, builder, settings);
 *   session->startPreview();
 *   session->toggleRecording();   // start
 *   session->captureStill();
 *   session->toggleRecording();   // graceful stop
 */
class CaptureSession : public QObject {
    Q_OBJECT

public:
    CaptureSession(MediaEngine* engine, const PipelineBuilder& builder,
                   const CaptureSettings& settings, QObject* parent = nullptr);
    ~CaptureSession() override;

    /**
     * @brief Tear down any pipeline and start a preview graph
     * @return true if the session is previewing afterwards
     */
    bool startPreview();

    /**
     * @brief Tear down any pipeline and start a record graph
     *
     * No-op (returns true) if already recording.
     */
    bool startRecording();

    /**
     * @brief Record button action: start recording or gracefully stop it
     */
    void toggleRecording();

    /**
     * @brief Force the pipeline down and go Idle. Idempotent.
     */
    void stop();

    /**
     * @brief Save the latest frame of the still-capture branch as a JPEG
     *
     * Blocks up to stillTimeoutMs.
     * @return true if a photo file was written
     */
    bool captureStill();

    /**
     * @brief Single entry point for all state transitions
     */
    void handleEvent(const SessionEvent& event);

    /**
     * @brief Select the camera source used by subsequent starts
     */
    void setCameraSource(const QString& source);
    QString cameraSource() const { return m_builder.cameraSource(); }

    CaptureMode mode() const { return m_mode; }
    bool isRecording() const { return m_mode == CaptureMode::Record; }
    bool isFinalizing() const { return m_finalizing; }
    bool hasPipeline() const { return m_pipeline != nullptr; }
    bool isStopFallbackArmed() const { return m_stopTimer->isActive(); }
    quint64 generation() const { return m_generation; }
    QString currentVideoPath() const { return m_currentVideoPath; }
    const CaptureSettings& settings() const { return m_settings; }
    const CapabilitySet& capabilities() const { return m_builder.capabilities(); }

signals:
    void modeChanged(CamCtl::CaptureMode mode);
    void recordingStarted(const QString& path);
    void recordingFinished(const QString& path);
    void photoCaptured(const QString& path);
    void pipelineStarted();
    void errorOccurred(const QString& message);

    /**
     * @brief The display sink's widget must be embedded into the preview area
     */
    void displayWidgetReady(QWidget* widget);

    /**
     * @brief The display sink's widget is about to be destroyed
     */
    void displayWidgetReleased(QWidget* widget);

private slots:
    void onStopTimeout();

private:
    bool startPipeline(CaptureMode mode);
    void requestGracefulStop();
    void teardown();
    void setMode(CaptureMode mode);
    bool writePhoto(const QString& path, const QByteArray& data);

    MediaEngine* m_engine;
    PipelineBuilder m_builder;
    CaptureSettings m_settings;
    EventBridge* m_bridge;
    QTimer* m_stopTimer;

    std::unique_ptr<Pipeline> m_pipeline;
    CaptureMode m_mode{CaptureMode::Idle};
    quint64 m_generation{0};
    quint64 m_stopGeneration{0};
    bool m_finalizing{false};
    bool m_debugDescriptions{false};
    QString m_currentVideoPath;
};

} // namespace CamCtl

#endif // CAPTURESESSION_H
