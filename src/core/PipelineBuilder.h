#ifndef PIPELINEBUILDER_H
#define PIPELINEBUILDER_H

#include <QString>
#include <QStringList>
#include "core/Capabilities.h"
#include "core/Config.h"
#include "core/MediaEngine.h"

namespace CamCtl {

/**
 * @brief Produces the capture graph descriptions
 *
 * Both graphs share one camera source fanned out by a tee. Every branch
 * starts with its own queue so a slow consumer cannot stall the others:
 *
 *   source ! convert ! caps ! tee
 *     tee. ! queue ! [scale] ! [overlays] ! display sink
 *     tee. ! queue ! [overlays] ! encoder ! parse ! splitmuxsink   (record)
 *     tee. ! queue ! [clock] ! jpegenc ! appsink (1 buffer, drop)
 *
 * The CapabilitySet is held by reference and must outlive the builder.
 */
class PipelineBuilder {
public:
    PipelineBuilder(const CapabilitySet& capabilities,
                    const CameraConfig& camera,
                    const OverlayConfig& overlay);

    /**
     * @brief Display + still-capture graph
     */
    GraphDescriptor buildPreviewGraph() const;

    /**
     * @brief Display + record + still-capture graph
     * @param outputPath File the record branch writes to. It is bound to
     *        the file sink after construction, not embedded in the text.
     */
    GraphDescriptor buildRecordGraph(const QString& outputPath) const;

    /**
     * @brief Change the camera source ("auto", "libcamera", "test", "v4l2:<dev>")
     */
    void setCameraSource(const QString& source) { m_camera.source = source; }
    QString cameraSource() const { return m_camera.source; }

    /**
     * @brief Source stage text for the current camera source
     */
    QString sourceStage() const;

    const CapabilitySet& capabilities() const { return m_capabilities; }

private:
    QString commonHead() const;
    QString displayBranch(bool recording) const;
    QString stillBranch() const;
    QString recordBranch() const;
    QString displaySink() const;

    QString crosshairOverlay() const;
    QString clockOverlay(const QString& valign) const;
    QString elapsedOverlay() const;

    static QString joinStages(const QStringList& stages);

    const CapabilitySet& m_capabilities;
    CameraConfig m_camera;
    OverlayConfig m_overlay;
};

} // namespace CamCtl

#endif // PIPELINEBUILDER_H
