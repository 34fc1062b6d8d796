/**
 * Camera Controller Application
 *
 * A native C++ Qt application for controlling a local camera through
 * GStreamer: live preview, still photos and H.264 recording with
 * on-screen overlays, plus browsers for the captured photos and videos.
 *
 * Features:
 * - Multi-branch capture graph (display, record, still capture)
 * - Embedded hardware-accelerated preview when available
 * - Graceful recording stop with forced-stop fallback
 * - Camera source selection (libcamera, V4L2 devices, test pattern)
 * - Photo browser and video player with seek
 */

#include <QApplication>
#include <QFile>
#include <QDebug>

#include "widgets/MainWindow.h"
#include "capture/GstMediaEngine.h"
#include "core/CaptureSession.h"
#include "core/PipelineBuilder.h"
#include "core/Config.h"
#include "utils/MediaPaths.h"

int main(int argc, char *argv[]) {
    QApplication::setApplicationName("Camera Controller");
    QApplication::setApplicationVersion("1.0.0");
    QApplication::setOrganizationName("CamCtl");

    QApplication::setHighDpiScaleFactorRoundingPolicy(
        Qt::HighDpiScaleFactorRoundingPolicy::PassThrough);

    // GStreamer consumes its own --gst-* options before Qt sees argv
    QString gstError;
    if (!CamCtl::GstMediaEngine::initialize(&argc, &argv, &gstError)) {
        qCritical() << "Cannot initialize GStreamer:" << gstError;
        return 1;
    }

    QApplication app(argc, argv);

    // Load configuration
    QString configPath = "config.json";
    if (!QFile::exists(configPath)) {
        configPath = QApplication::applicationDirPath() + "/config.json";
    }

    CamCtl::Config& config = CamCtl::Config::instance();
    if (!config.load(configPath)) {
        qWarning() << "Using default configuration";
    }

    // Ensure output directories exist
    const CamCtl::StorageConfig storage = config.storage();
    CamCtl::MediaPaths::ensureDirectoryExists(storage.photoDirectory);
    CamCtl::MediaPaths::ensureDirectoryExists(storage.videoDirectory);

    // Detect optional elements once
    CamCtl::GstMediaEngine engine;
    const CamCtl::CapabilitySet capabilities = engine.probeCapabilities();
    if (!capabilities.hasEmbeddableSink) {
        qWarning() << "No embeddable video sink found. Preview will open in a separate window.";
    }

    CamCtl::PipelineBuilder builder(capabilities, config.camera(), config.overlay());
    CamCtl::CaptureSession session(&engine, builder,
                                   CamCtl::CaptureSettings::fromConfig(storage, config.timing()));

    CamCtl::MainWindow mainWindow(&session);
    mainWindow.show();

    qDebug() << "Camera Controller started";
    qDebug() << "Photos:" << storage.photoDirectory;
    qDebug() << "Videos:" << storage.videoDirectory;
    qDebug() << "Camera source:" << config.camera().source;

    const int result = app.exec();

    // Released pipelines are deleted on the event loop
    session.stop();
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);

    return result;
}
