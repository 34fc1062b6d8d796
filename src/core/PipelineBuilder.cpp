#include "PipelineBuilder.h"
#include <QDebug>

namespace CamCtl {

PipelineBuilder::PipelineBuilder(const CapabilitySet& capabilities,
                                 const CameraConfig& camera,
                                 const OverlayConfig& overlay)
    : m_capabilities(capabilities)
    , m_camera(camera)
    , m_overlay(overlay)
{
}

GraphDescriptor PipelineBuilder::buildPreviewGraph() const {
    GraphDescriptor graph;
    graph.mode = CaptureMode::Preview;
    graph.embeddableDisplay = m_capabilities.hasEmbeddableSink;

    QStringList parts;
    parts << commonHead()
          << displayBranch(false)
          << stillBranch();
    graph.launchDescription = parts.join(' ');
    return graph;
}

GraphDescriptor PipelineBuilder::buildRecordGraph(const QString& outputPath) const {
    GraphDescriptor graph;
    graph.mode = CaptureMode::Record;
    graph.outputPath = outputPath;
    graph.encoderName = CapabilitySet::encoderFactoryName(m_capabilities.encoderChoice);
    graph.embeddableDisplay = m_capabilities.hasEmbeddableSink;

    if (m_capabilities.encoderChoice == EncoderChoice::NoneAvailable) {
        qCritical() << "PipelineBuilder: No H264 encoder available, using" << graph.encoderName
                    << "anyway. Install gstreamer1.0-plugins-ugly or openh264.";
    }

    QStringList parts;
    parts << commonHead()
          << displayBranch(true)
          << recordBranch()
          << stillBranch();
    graph.launchDescription = parts.join(' ');
    return graph;
}

QString PipelineBuilder::sourceStage() const {
    const QString source = m_camera.source.trimmed();

    if (source.startsWith("v4l2:")) {
        const QString device = source.mid(5);
        if (device.isEmpty()) {
            return QString("v4l2src name=%1").arg(GraphDescriptor::SourceName);
        }
        return QString("v4l2src name=%1 device=%2").arg(GraphDescriptor::SourceName, device);
    }
    if (source == "libcamera") {
        return QString("libcamerasrc name=%1").arg(GraphDescriptor::SourceName);
    }
    if (source == "test") {
        return QString("videotestsrc name=%1 is-live=true").arg(GraphDescriptor::SourceName);
    }

    if (source != "auto") {
        qWarning() << "PipelineBuilder: Unknown camera source" << source << "- using auto";
    }

    // auto
    if (m_capabilities.hasLibcameraSource) {
        return QString("libcamerasrc name=%1").arg(GraphDescriptor::SourceName);
    }
    return QString("v4l2src name=%1").arg(GraphDescriptor::SourceName);
}

QString PipelineBuilder::commonHead() const {
    return joinStages({
        sourceStage(),
        "videoconvert",
        "videoscale",
        QString("video/x-raw,format=%1,width=%2,height=%3")
            .arg(m_camera.format).arg(m_camera.width).arg(m_camera.height),
        QString("tee name=%1").arg(GraphDescriptor::TeeName)
    });
}

QString PipelineBuilder::displayBranch(bool recording) const {
    QStringList stages;
    stages << QString("%1.").arg(GraphDescriptor::TeeName)
           << "queue leaky=downstream max-size-buffers=3";

    if (m_camera.previewWidth > 0 && m_camera.previewHeight > 0) {
        stages << "videoscale"
               << QString("video/x-raw,width=%1,height=%2")
                      .arg(m_camera.previewWidth).arg(m_camera.previewHeight);
    }

    stages << "videoconvert";

    if (m_overlay.crosshair) {
        stages << crosshairOverlay();
    }
    if (m_overlay.clock) {
        stages << clockOverlay("bottom");
    }
    if (recording && m_overlay.elapsed) {
        stages << elapsedOverlay();
    }

    stages << "videoconvert" << displaySink();
    return joinStages(stages);
}

QString PipelineBuilder::stillBranch() const {
    QStringList stages;
    stages << QString("%1.").arg(GraphDescriptor::TeeName)
           << "queue leaky=downstream max-size-buffers=1"
           << "videoconvert";

    if (m_overlay.clock) {
        stages << clockOverlay("bottom") << "videoconvert";
    }

    stages << "jpegenc"
           << QString("appsink name=%1 max-buffers=1 drop=true sync=false")
                  .arg(GraphDescriptor::StillSinkName);
    return joinStages(stages);
}

QString PipelineBuilder::recordBranch() const {
    const EncoderChoice encoder = m_capabilities.encoderChoice;

    QStringList stages;
    stages << QString("%1.").arg(GraphDescriptor::TeeName)
           // Up to 3 s of raw frames absorb encoder stalls, older frames drop after that
           << "queue leaky=downstream max-size-buffers=0 max-size-bytes=0 max-size-time=3000000000"
           << "videoconvert";

    if (m_overlay.clock) {
        stages << clockOverlay("bottom");
    }
    if (m_overlay.elapsed) {
        stages << elapsedOverlay();
    }
    if (m_overlay.clock || m_overlay.elapsed) {
        stages << "videoconvert";
    }

    stages << QString("%1 %2").arg(CapabilitySet::encoderFactoryName(encoder),
                                   CapabilitySet::encoderTuning(encoder))
           << "h264parse"
           << QString("splitmuxsink name=%1 muxer-factory=mp4mux")
                  .arg(GraphDescriptor::FileSinkName);
    return joinStages(stages);
}

QString PipelineBuilder::displaySink() const {
    if (m_capabilities.hasEmbeddableSink && !m_capabilities.embeddableSinkFactory.isEmpty()) {
        return QString("%1 name=%2 sync=false")
            .arg(m_capabilities.embeddableSinkFactory, GraphDescriptor::DisplaySinkName);
    }
    return QString("autovideosink name=%1 sync=false").arg(GraphDescriptor::DisplaySinkName);
}

QString PipelineBuilder::crosshairOverlay() const {
    return "textoverlay text=\"+\" halignment=center valignment=center font-desc=\"Sans 32\"";
}

QString PipelineBuilder::clockOverlay(const QString& valign) const {
    QString format = m_overlay.clockFormat;
    format.remove('"');
    return QString("clockoverlay time-format=\"%1\" halignment=left valignment=%2 shaded-background=true")
        .arg(format, valign);
}

QString PipelineBuilder::elapsedOverlay() const {
    return "timeoverlay time-mode=running-time halignment=right valignment=top shaded-background=true";
}

QString PipelineBuilder::joinStages(const QStringList& stages) {
    return stages.join(" ! ");
}

} // namespace CamCtl
