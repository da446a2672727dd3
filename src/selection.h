#ifndef IDCROP_SELECTION_H
#define IDCROP_SELECTION_H

#include "detection.h"
#include <optional>
#include <string>

namespace idcrop {

enum class SelectionMode {
    LARGEST_ONLY,   // Keep the single largest face
    ALL_FACES       // Keep up to max_faces, largest first
};

// Rank by box area (descending, stable on detector order) and truncate.
// Index 0 of the result is the main portrait. max_faces < 1 counts as 1.
DetectionSet selectDetections(DetectionSet detections, SelectionMode mode, int max_faces = 1);

// "largest" / "all" (also accepts "largest-only", "all-faces")
std::optional<SelectionMode> parseSelectionMode(const std::string& text);
std::string selectionModeToString(SelectionMode mode);

} // namespace idcrop

#endif // IDCROP_SELECTION_H
