#include "GstCapturePipeline.h"
#include "widgets/VideoSurface.h"
#include <gst/app/gstappsink.h>
#include <gst/video/videooverlay.h>
#include <QDebug>

namespace CamCtl {

namespace {

QString elementName(GstMessage* message) {
    if (GST_MESSAGE_SRC(message) && GST_IS_OBJECT(GST_MESSAGE_SRC(message))) {
        return QString::fromUtf8(GST_OBJECT_NAME(GST_MESSAGE_SRC(message)));
    }
    return QString();
}

// splitmuxsink treats location as a printf pattern
QString escapeLocation(const QString& path) {
    QString escaped = path;
    escaped.replace("%", "%%");
    return escaped;
}

} // namespace

std::unique_ptr<GstCapturePipeline> GstCapturePipeline::create(const GraphDescriptor& graph,
                                                               QString* errorMessage) {
    qDebug() << "=== GstCapturePipeline::create ===" << captureModeName(graph.mode);

    GError* error = nullptr;
    GstElement* pipeline = gst_parse_launch(graph.launchDescription.toUtf8().constData(), &error);

    if (error) {
        const QString message = QString::fromUtf8(error->message);
        g_clear_error(&error);
        if (pipeline) {
            gst_object_unref(pipeline);
        }
        qWarning() << "  Parse failed:" << message;
        if (errorMessage) *errorMessage = message;
        return nullptr;
    }

    if (!pipeline) {
        if (errorMessage) *errorMessage = "gst_parse_launch returned no pipeline";
        return nullptr;
    }

    std::unique_ptr<GstCapturePipeline> result(new GstCapturePipeline(pipeline, graph));

    if (!result->m_stillSink) {
        if (errorMessage) *errorMessage = QString("Stage '%1' not found").arg(GraphDescriptor::StillSinkName);
        return nullptr;
    }

    if (graph.mode == CaptureMode::Record) {
        GstElement* fileSink = gst_bin_get_by_name(GST_BIN(pipeline), GraphDescriptor::FileSinkName);
        if (!fileSink) {
            if (errorMessage) *errorMessage = QString("Stage '%1' not found").arg(GraphDescriptor::FileSinkName);
            return nullptr;
        }
        g_object_set(fileSink, "location", escapeLocation(graph.outputPath).toUtf8().constData(), nullptr);
        gst_object_unref(fileSink);
        qDebug() << "  Recording location:" << result->recordingLocation();
    }

    return result;
}

GstCapturePipeline::GstCapturePipeline(GstElement* pipeline, const GraphDescriptor& graph)
    : m_pipeline(pipeline)
    , m_graph(graph)
{
    m_displaySink = gst_bin_get_by_name(GST_BIN(m_pipeline), GraphDescriptor::DisplaySinkName);
    m_stillSink = gst_bin_get_by_name(GST_BIN(m_pipeline), GraphDescriptor::StillSinkName);

    GstBus* bus = gst_element_get_bus(m_pipeline);
    gst_bus_set_sync_handler(bus, &GstCapturePipeline::busSyncHandler, this, nullptr);
    gst_object_unref(bus);

    if (m_graph.embeddableDisplay && m_displaySink && GST_IS_VIDEO_OVERLAY(m_displaySink)) {
        m_surface = new VideoSurface();
        qDebug() << "GstCapturePipeline: Display renders into embedded surface";
    } else {
        qDebug() << "GstCapturePipeline: Display sink opens its own window";
    }
}

GstCapturePipeline::~GstCapturePipeline() {
    stop();

    GstBus* bus = gst_element_get_bus(m_pipeline);
    gst_bus_set_sync_handler(bus, nullptr, nullptr, nullptr);
    gst_object_unref(bus);

    if (m_displaySink) gst_object_unref(m_displaySink);
    if (m_stillSink) gst_object_unref(m_stillSink);
    gst_object_unref(m_pipeline);

    if (m_surface) {
        delete m_surface.data();
    }
}

bool GstCapturePipeline::play() {
    qDebug() << "GstCapturePipeline: Setting" << captureModeName(m_graph.mode) << "pipeline to PLAYING";

    bindWindowHandle();

    m_stopped = false;
    const GstStateChangeReturn ret = gst_element_set_state(m_pipeline, GST_STATE_PLAYING);
    if (ret == GST_STATE_CHANGE_FAILURE) {
        qWarning() << "GstCapturePipeline: State change to PLAYING failed";
        stop();
        return false;
    }
    return true;
}

void GstCapturePipeline::stop() {
    if (m_stopped) {
        return;
    }
    m_stopped = true;
    gst_element_set_state(m_pipeline, GST_STATE_NULL);
    qDebug() << "GstCapturePipeline: Pipeline set to NULL";
}

bool GstCapturePipeline::sendEndOfStream() {
    if (m_stopped) {
        return false;
    }
    qDebug() << "GstCapturePipeline: Sending EOS";
    return gst_element_send_event(m_pipeline, gst_event_new_eos()) == TRUE;
}

bool GstCapturePipeline::pullStill(int timeoutMs, QByteArray& data) {
    if (!m_stillSink || m_stopped) {
        return false;
    }

    GstSample* sample = gst_app_sink_try_pull_sample(GST_APP_SINK(m_stillSink),
                                                     static_cast<GstClockTime>(timeoutMs) * GST_MSECOND);
    if (!sample) {
        return false;
    }

    bool ok = false;
    GstBuffer* buffer = gst_sample_get_buffer(sample);
    GstMapInfo map;
    if (buffer && gst_buffer_map(buffer, &map, GST_MAP_READ)) {
        data = QByteArray(reinterpret_cast<const char*>(map.data), static_cast<int>(map.size));
        gst_buffer_unmap(buffer, &map);
        ok = true;
    }

    gst_sample_unref(sample);
    return ok;
}

QWidget* GstCapturePipeline::displayWidget() const {
    return m_surface.data();
}

QString GstCapturePipeline::recordingLocation() const {
    GstElement* fileSink = gst_bin_get_by_name(GST_BIN(m_pipeline), GraphDescriptor::FileSinkName);
    if (!fileSink) {
        return QString();
    }

    gchar* location = nullptr;
    g_object_get(fileSink, "location", &location, nullptr);
    const QString result = QString::fromUtf8(location);
    g_free(location);
    gst_object_unref(fileSink);
    return result;
}

void GstCapturePipeline::bindWindowHandle() {
    if (!m_surface || !m_displaySink) {
        return;
    }

    m_windowHandle = static_cast<guintptr>(m_surface->winId());
    gst_video_overlay_set_window_handle(GST_VIDEO_OVERLAY(m_displaySink), m_windowHandle);
    qDebug() << "GstCapturePipeline: Bound window handle" << Qt::hex << m_windowHandle;
}

GstBusSyncReply GstCapturePipeline::busSyncHandler(GstBus* bus, GstMessage* message, gpointer userData) {
    Q_UNUSED(bus);
    auto* self = static_cast<GstCapturePipeline*>(userData);
    if (self->handleSyncMessage(message)) {
        gst_message_unref(message);
        return GST_BUS_DROP;
    }
    return GST_BUS_PASS;
}

// Runs on GStreamer threads
bool GstCapturePipeline::handleSyncMessage(GstMessage* message) {
    if (gst_is_video_overlay_prepare_window_handle_message(message)) {
        if (m_windowHandle != 0) {
            gst_video_overlay_set_window_handle(GST_VIDEO_OVERLAY(GST_MESSAGE_SRC(message)), m_windowHandle);
        }
        return true;
    }

    PipelineEvent event;
    event.source = elementName(message);

    switch (GST_MESSAGE_TYPE(message)) {
        case GST_MESSAGE_ERROR: {
            GError* error = nullptr;
            gchar* debug = nullptr;
            gst_message_parse_error(message, &error, &debug);
            event.type = PipelineEvent::Type::Error;
            event.message = error ? QString::fromUtf8(error->message) : QString("Unknown error");
            event.debugInfo = debug ? QString::fromUtf8(debug) : QString();
            g_clear_error(&error);
            g_free(debug);
            break;
        }

        case GST_MESSAGE_WARNING: {
            GError* error = nullptr;
            gchar* debug = nullptr;
            gst_message_parse_warning(message, &error, &debug);
            event.type = PipelineEvent::Type::Warning;
            event.message = error ? QString::fromUtf8(error->message) : QString();
            event.debugInfo = debug ? QString::fromUtf8(debug) : QString();
            g_clear_error(&error);
            g_free(debug);
            break;
        }

        case GST_MESSAGE_EOS:
            event.type = PipelineEvent::Type::EndOfStream;
            break;

        case GST_MESSAGE_DURATION_CHANGED:
            event.type = PipelineEvent::Type::DurationChanged;
            break;

        case GST_MESSAGE_STATE_CHANGED: {
            // Only the top-level pipeline's transitions matter
            if (GST_MESSAGE_SRC(message) != GST_OBJECT(m_pipeline)) {
                return true;
            }
            GstState oldState, newState, pending;
            gst_message_parse_state_changed(message, &oldState, &newState, &pending);
            event.type = PipelineEvent::Type::StateChanged;
            event.playing = (newState == GST_STATE_PLAYING);
            event.message = QString("%1 -> %2").arg(gst_element_state_get_name(oldState),
                                                    gst_element_state_get_name(newState));
            break;
        }

        default:
            return true;
    }

    postEvent(event);
    return true;
}

void GstCapturePipeline::postEvent(const PipelineEvent& event) {
    QMetaObject::invokeMethod(this, [this, event]() {
        emit pipelineEvent(event);
    }, Qt::QueuedConnection);
}

} // namespace CamCtl
