#ifndef GSTCAPTUREPIPELINE_H
#define GSTCAPTUREPIPELINE_H

#include <QPointer>
#include <memory>
#include <gst/gst.h>
#include "core/MediaEngine.h"

namespace CamCtl {

class VideoSurface;

/**
 * @brief GStreamer implementation of a capture graph
 *
 * Built from a gst-launch description. Bus messages arrive on GStreamer
 * streaming threads through a sync handler and are re-posted to this
 * object's thread, so pipelineEvent() is always emitted on the GUI thread.
 *
 * When the graph uses an embeddable display sink, a native VideoSurface
 * is created for it. The window handle is bound in play(), after the
 * surface has been embedded.
 */
class GstCapturePipeline : public Pipeline {
    Q_OBJECT

public:
    ~GstCapturePipeline() override;

    /**
     * @brief Parse the description and resolve the named stages
     * @return nullptr on parse failure or missing required stage
     */
    static std::unique_ptr<GstCapturePipeline> create(const GraphDescriptor& graph,
                                                      QString* errorMessage);

    bool play() override;
    void stop() override;
    bool sendEndOfStream() override;
    bool pullStill(int timeoutMs, QByteArray& data) override;
    QWidget* displayWidget() const override;

    /**
     * @brief location currently set on the file sink, empty without one
     */
    QString recordingLocation() const;

private:
    GstCapturePipeline(GstElement* pipeline, const GraphDescriptor& graph);

    static GstBusSyncReply busSyncHandler(GstBus* bus, GstMessage* message, gpointer userData);
    bool handleSyncMessage(GstMessage* message);
    void postEvent(const PipelineEvent& event);
    void bindWindowHandle();

    GstElement* m_pipeline{nullptr};
    GstElement* m_displaySink{nullptr};
    GstElement* m_stillSink{nullptr};
    GraphDescriptor m_graph;

    QPointer<VideoSurface> m_surface;
    guintptr m_windowHandle{0};
    bool m_stopped{true};
};

} // namespace CamCtl

#endif // GSTCAPTUREPIPELINE_H
