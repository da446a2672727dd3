#include "selection.h"
#include <algorithm>
#include <cctype>

namespace idcrop {

DetectionSet selectDetections(DetectionSet detections, SelectionMode mode, int max_faces) {
    std::stable_sort(detections.begin(), detections.end(),
        [](const Detection& a, const Detection& b) {
            return a.box.area() > b.box.area();
        });

    size_t keep = 1;
    if (mode == SelectionMode::ALL_FACES) {
        keep = static_cast<size_t>(std::max(1, max_faces));
    }

    if (detections.size() > keep) {
        detections.resize(keep);
    }
    return detections;
}

std::optional<SelectionMode> parseSelectionMode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "largest" || lower == "largest-only" || lower == "largest_only") {
        return SelectionMode::LARGEST_ONLY;
    }
    if (lower == "all" || lower == "all-faces" || lower == "all_faces") {
        return SelectionMode::ALL_FACES;
    }
    return std::nullopt;
}

std::string selectionModeToString(SelectionMode mode) {
    switch (mode) {
        case SelectionMode::LARGEST_ONLY: return "largest";
        case SelectionMode::ALL_FACES: return "all";
    }
    return "unknown";
}

} // namespace idcrop
