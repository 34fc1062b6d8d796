#include "Capabilities.h"

namespace CamCtl {

EncoderChoice CapabilitySet::chooseEncoder(bool hasX264, bool hasOpenH264) {
    if (hasX264) {
        return EncoderChoice::X264;
    }
    if (hasOpenH264) {
        return EncoderChoice::OpenH264;
    }
    return EncoderChoice::NoneAvailable;
}

QString CapabilitySet::encoderFactoryName(EncoderChoice choice) {
    switch (choice) {
        case EncoderChoice::OpenH264: return "openh264enc";
        case EncoderChoice::X264:
        case EncoderChoice::NoneAvailable:
        default: return "x264enc";
    }
}

QString CapabilitySet::encoderTuning(EncoderChoice choice) {
    switch (choice) {
        case EncoderChoice::OpenH264: return "complexity=low";
        case EncoderChoice::X264:
        case EncoderChoice::NoneAvailable:
        default: return "speed-preset=ultrafast tune=zerolatency";
    }
}

QString CapabilitySet::encoderChoiceName(EncoderChoice choice) {
    switch (choice) {
        case EncoderChoice::X264: return "x264";
        case EncoderChoice::OpenH264: return "openh264";
        case EncoderChoice::NoneAvailable: return "none";
    }
    return "none";
}

} // namespace CamCtl
