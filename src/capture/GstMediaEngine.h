#ifndef GSTMEDIAENGINE_H
#define GSTMEDIAENGINE_H

#include <QString>
#include "core/MediaEngine.h"

namespace CamCtl {

/**
 * @brief MediaEngine backed by GStreamer 1.x
 *
 * initialize() must succeed before any other call.
 */
class GstMediaEngine : public MediaEngine {
public:
    GstMediaEngine() = default;
    ~GstMediaEngine() override = default;

    /**
     * @brief Initialize GStreamer (consumes --gst-* arguments)
     * @return false with errorMessage set if initialization failed
     */
    static bool initialize(int* argc, char*** argv, QString* errorMessage);

    /**
     * @brief Check whether an element factory is registered
     */
    static bool hasElement(const char* factoryName);

    /**
     * @brief Engine version, e.g. "GStreamer 1.22.0"
     */
    static QString versionString();

    CapabilitySet probeCapabilities() override;
    std::unique_ptr<Pipeline> createPipeline(const GraphDescriptor& graph,
                                             QString* errorMessage) override;
};

} // namespace CamCtl

#endif // GSTMEDIAENGINE_H
