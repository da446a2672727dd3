#ifndef IDCROP_SETTINGS_H
#define IDCROP_SETTINGS_H

#include "config.h"
#include "face_detector.h"
#include "portrait_extractor.h"

namespace idcrop {

struct Settings {
    DetectorSettings detector;
    ExtractionOptions extraction;
};

// Defaults overridden by every valid key in `config`. Keys that are missing
// or fail validation keep their default.
Settings settingsFromConfig(const Config& config);

// [logging] level / file / max_lines -> Logger
void applyLoggingConfig(const Config& config);

} // namespace idcrop

#endif // IDCROP_SETTINGS_H
