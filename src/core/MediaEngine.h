#ifndef MEDIAENGINE_H
#define MEDIAENGINE_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include <QMetaType>
#include <memory>
#include "core/Capabilities.h"

class QWidget;

namespace CamCtl {

/**
 * @brief Capture session mode
 */
enum class CaptureMode {
    Idle,
    Preview,
    Record
};

QString captureModeName(CaptureMode mode);

/**
 * @brief Declarative description of a capture graph
 *
 * launchDescription is engine syntax (gst-launch style). Stages that the
 * session needs to reach at runtime carry the fixed names below.
 */
struct GraphDescriptor {
    static constexpr const char* SourceName = "cam";
    static constexpr const char* TeeName = "t";
    static constexpr const char* DisplaySinkName = "video_sink";
    static constexpr const char* StillSinkName = "photo_sink";
    static constexpr const char* FileSinkName = "file_sink";

    CaptureMode mode = CaptureMode::Idle;
    QString launchDescription;
    QString outputPath;          // Record mode only
    QString encoderName;         // Record mode only
    bool embeddableDisplay = false;
};

/**
 * @brief Asynchronous notification from a running pipeline
 */
struct PipelineEvent {
    enum class Type {
        Error,
        Warning,
        EndOfStream,
        DurationChanged,
        StateChanged,
        Other
    };

    Type type = Type::Other;
    QString source;       // Name of the emitting stage
    QString message;
    QString debugInfo;
    bool playing = false; // StateChanged: pipeline reached PLAYING

    static QString typeName(Type type);
};

/**
 * @brief One instantiated capture graph
 *
 * Owned exclusively by the CaptureSession. Events are delivered on the
 * application thread through pipelineEvent().
 */
class Pipeline : public QObject {
    Q_OBJECT

public:
    explicit Pipeline(QObject* parent = nullptr) : QObject(parent) {}
    ~Pipeline() override = default;

    /**
     * @brief Move the graph to PLAYING
     * @return false if the state change failed
     */
    virtual bool play() = 0;

    /**
     * @brief Force the graph to NULL. Idempotent.
     */
    virtual void stop() = 0;

    /**
     * @brief Inject end-of-stream so file writers can finalize
     */
    virtual bool sendEndOfStream() = 0;

    /**
     * @brief Pull the latest encoded still from the still-capture sink
     * @param timeoutMs Bounded wait. This call blocks.
     * @param data Receives the encoded bytes
     * @return false on timeout or if the sink is missing
     */
    virtual bool pullStill(int timeoutMs, QByteArray& data) = 0;

    /**
     * @brief Widget the display sink renders into, nullptr if not embeddable
     */
    virtual QWidget* displayWidget() const = 0;

signals:
    void pipelineEvent(const CamCtl::PipelineEvent& event);
};

/**
 * @brief Factory for pipelines and capability probing
 */
class MediaEngine {
public:
    virtual ~MediaEngine() = default;

    /**
     * @brief Detect optional elements. Call once and cache the result.
     */
    virtual CapabilitySet probeCapabilities() = 0;

    /**
     * @brief Construct (but do not start) a graph
     * @param errorMessage Receives the construction error on failure
     * @return nullptr if the description could not be instantiated
     */
    virtual std::unique_ptr<Pipeline> createPipeline(const GraphDescriptor& graph,
                                                     QString* errorMessage) = 0;
};

} // namespace CamCtl

Q_DECLARE_METATYPE(CamCtl::CaptureMode)
Q_DECLARE_METATYPE(CamCtl::PipelineEvent)

#endif // MEDIAENGINE_H
