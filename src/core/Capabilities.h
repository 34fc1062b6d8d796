#ifndef CAPABILITIES_H
#define CAPABILITIES_H

#include <QString>

namespace CamCtl {

/**
 * @brief Software H.264 encoder selected for the record branch
 */
enum class EncoderChoice {
    X264,           // x264enc (preferred)
    OpenH264,       // openh264enc
    NoneAvailable   // falls back to the x264enc id, graph construction will fail
};

/**
 * @brief Optional engine features detected once at startup
 *
 * Immutable after detection. The pipeline builder only reads it.
 */
struct CapabilitySet {
    bool hasEmbeddableSink = false;
    QString embeddableSinkFactory;     // e.g. "glimagesink", empty if none
    bool hasLibcameraSource = false;
    EncoderChoice encoderChoice = EncoderChoice::NoneAvailable;

    /**
     * @brief Encoder selection policy: prefer x264, then openh264
     */
    static EncoderChoice chooseEncoder(bool hasX264, bool hasOpenH264);

    /**
     * @brief Element factory name for an encoder choice
     *
     * NoneAvailable maps to the x264enc id on purpose.
     */
    static QString encoderFactoryName(EncoderChoice choice);

    /**
     * @brief Low-latency property string for the encoder element
     */
    static QString encoderTuning(EncoderChoice choice);

    static QString encoderChoiceName(EncoderChoice choice);
};

} // namespace CamCtl

#endif // CAPABILITIES_H
