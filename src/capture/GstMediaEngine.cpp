#include "GstMediaEngine.h"
#include "GstCapturePipeline.h"
#include <gst/gst.h>
#include <QDebug>

namespace CamCtl {

namespace {

// Sinks implementing GstVideoOverlay, in preference order
const char* const kEmbeddableSinks[] = {"glimagesink", "xvimagesink", "ximagesink"};

// Elements every graph needs
const char* const kRequiredElements[] = {
    "videoconvert", "videoscale", "tee", "queue", "jpegenc", "appsink"
};

} // namespace

bool GstMediaEngine::initialize(int* argc, char*** argv, QString* errorMessage) {
    GError* error = nullptr;
    if (!gst_init_check(argc, argv, &error)) {
        const QString message = error ? QString::fromUtf8(error->message)
                                      : QString("gst_init_check failed");
        g_clear_error(&error);
        qCritical() << "GstMediaEngine: Initialization failed:" << message;
        if (errorMessage) *errorMessage = message;
        return false;
    }
    qDebug() << "GstMediaEngine: Initialized" << versionString();
    return true;
}

bool GstMediaEngine::hasElement(const char* factoryName) {
    GstElementFactory* factory = gst_element_factory_find(factoryName);
    if (!factory) {
        return false;
    }
    gst_object_unref(factory);
    return true;
}

QString GstMediaEngine::versionString() {
    gchar* version = gst_version_string();
    const QString result = QString::fromUtf8(version);
    g_free(version);
    return result;
}

CapabilitySet GstMediaEngine::probeCapabilities() {
    qDebug() << "=== GstMediaEngine::probeCapabilities ===";

    CapabilitySet caps;

    for (const char* sink : kEmbeddableSinks) {
        if (hasElement(sink)) {
            caps.hasEmbeddableSink = true;
            caps.embeddableSinkFactory = QString::fromLatin1(sink);
            break;
        }
    }

    caps.hasLibcameraSource = hasElement("libcamerasrc");
    caps.encoderChoice = CapabilitySet::chooseEncoder(hasElement("x264enc"),
                                                      hasElement("openh264enc"));

    for (const char* element : kRequiredElements) {
        if (!hasElement(element)) {
            qWarning() << "  Missing element:" << element;
        }
    }
    if (!hasElement("splitmuxsink") || !hasElement("h264parse")) {
        qWarning() << "  Recording unavailable: splitmuxsink/h264parse missing";
    }

    qDebug() << "  Embeddable sink:" << (caps.hasEmbeddableSink ? caps.embeddableSinkFactory : QString("none"));
    qDebug() << "  libcamerasrc:" << caps.hasLibcameraSource;
    if (caps.encoderChoice == EncoderChoice::NoneAvailable) {
        qWarning() << "  No H.264 encoder (x264enc/openh264enc): recording will fail";
    } else {
        qDebug() << "  Encoder:" << CapabilitySet::encoderChoiceName(caps.encoderChoice);
    }

    return caps;
}

std::unique_ptr<Pipeline> GstMediaEngine::createPipeline(const GraphDescriptor& graph,
                                                         QString* errorMessage) {
    return GstCapturePipeline::create(graph, errorMessage);
}

} // namespace CamCtl
