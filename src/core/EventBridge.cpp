#include "EventBridge.h"
#include <QDebug>

namespace CamCtl {

QString SessionEvent::typeName(Type type) {
    switch (type) {
        case Type::StartPreview: return "StartPreview";
        case Type::StartRecording: return "StartRecording";
        case Type::ToggleRecord: return "ToggleRecord";
        case Type::StopRequested: return "StopRequested";
        case Type::EngineError: return "EngineError";
        case Type::EndOfStream: return "EndOfStream";
        case Type::StopTimeout: return "StopTimeout";
        case Type::PipelineStarted: return "PipelineStarted";
    }
    return "Unknown";
}

EventBridge::EventBridge(QObject* parent)
    : QObject(parent)
{
}

EventBridge::~EventBridge() {
    detach();
}

void EventBridge::attach(Pipeline* pipeline, quint64 generation) {
    detach();

    if (!pipeline) {
        return;
    }

    m_pipeline = pipeline;
    m_generation = generation;
    m_connection = connect(pipeline, &Pipeline::pipelineEvent, this,
                           [this, generation](const PipelineEvent& event) {
                               onPipelineEvent(event, generation);
                           });
}

void EventBridge::detach() {
    if (m_connection) {
        disconnect(m_connection);
        m_connection = QMetaObject::Connection();
    }
    m_pipeline.clear();
}

void EventBridge::onPipelineEvent(const PipelineEvent& event, quint64 generation) {
    switch (event.type) {
        case PipelineEvent::Type::Error: {
            qWarning() << "EventBridge: Error from" << event.source << "-" << event.message;
            if (!event.debugInfo.isEmpty()) {
                qWarning() << "  Debug info:" << event.debugInfo;
            }
            SessionEvent sessionEvt;
            sessionEvt.type = SessionEvent::Type::EngineError;
            sessionEvt.detail = event.source.isEmpty()
                ? event.message
                : QString("%1: %2").arg(event.source, event.message);
            sessionEvt.generation = generation;
            emit sessionEvent(sessionEvt);
            break;
        }

        case PipelineEvent::Type::EndOfStream: {
            qDebug() << "EventBridge: EOS received (generation" << generation << ")";
            SessionEvent sessionEvt;
            sessionEvt.type = SessionEvent::Type::EndOfStream;
            sessionEvt.generation = generation;
            emit sessionEvent(sessionEvt);
            break;
        }

        case PipelineEvent::Type::StateChanged:
            if (event.playing) {
                qDebug() << "EventBridge: Pipeline is PLAYING (generation" << generation << ")";
                SessionEvent sessionEvt;
                sessionEvt.type = SessionEvent::Type::PipelineStarted;
                sessionEvt.generation = generation;
                emit sessionEvent(sessionEvt);
            }
            break;

        case PipelineEvent::Type::Warning:
            qWarning() << "EventBridge: Warning from" << event.source << "-" << event.message;
            break;

        case PipelineEvent::Type::DurationChanged:
        case PipelineEvent::Type::Other:
        default:
            qDebug() << "EventBridge:" << PipelineEvent::typeName(event.type)
                     << "from" << event.source << event.message;
            break;
    }
}

} // namespace CamCtl
