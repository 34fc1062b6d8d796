#include "MediaEngine.h"

namespace CamCtl {

QString captureModeName(CaptureMode mode) {
    switch (mode) {
        case CaptureMode::Idle: return "Idle";
        case CaptureMode::Preview: return "Preview";
        case CaptureMode::Record: return "Record";
    }
    return "Idle";
}

QString PipelineEvent::typeName(Type type) {
    switch (type) {
        case Type::Error: return "Error";
        case Type::Warning: return "Warning";
        case Type::EndOfStream: return "EndOfStream";
        case Type::DurationChanged: return "DurationChanged";
        case Type::StateChanged: return "StateChanged";
        case Type::Other: return "Other";
    }
    return "Other";
}

} // namespace CamCtl
