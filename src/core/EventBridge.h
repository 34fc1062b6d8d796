#ifndef EVENTBRIDGE_H
#define EVENTBRIDGE_H

#include <QObject>
#include <QPointer>
#include <QString>
#include "core/MediaEngine.h"

namespace CamCtl {

/**
 * @brief State-machine input for the CaptureSession
 *
 * generation ties an event to the pipeline that produced it. Zero means
 * the event does not come from a pipeline (UI action).
 */
struct SessionEvent {
    enum class Type {
        StartPreview,
        StartRecording,
        ToggleRecord,
        StopRequested,
        EngineError,
        EndOfStream,
        StopTimeout,
        PipelineStarted
    };

    Type type = Type::StopRequested;
    QString detail;
    quint64 generation = 0;

    static QString typeName(Type type);
};

/**
 * @brief Translates pipeline bus notifications into session events
 *
 * Only errors, end-of-stream and the transition to PLAYING change session
 * state. Everything else is logged and dropped.
 */
class EventBridge : public QObject {
    Q_OBJECT

public:
    explicit EventBridge(QObject* parent = nullptr);
    ~EventBridge() override;

    /**
     * @brief Start forwarding events of pipeline, tagged with generation
     *
     * Any previously attached pipeline is detached first.
     */
    void attach(Pipeline* pipeline, quint64 generation);

    /**
     * @brief Stop forwarding. Safe to call when nothing is attached.
     */
    void detach();

    bool isAttached() const { return !m_pipeline.isNull(); }
    quint64 generation() const { return m_generation; }

signals:
    void sessionEvent(const CamCtl::SessionEvent& event);

private:
    void onPipelineEvent(const PipelineEvent& event, quint64 generation);

    QPointer<Pipeline> m_pipeline;
    QMetaObject::Connection m_connection;
    quint64 m_generation{0};
};

} // namespace CamCtl

Q_DECLARE_METATYPE(CamCtl::SessionEvent)

#endif // EVENTBRIDGE_H
