#ifndef IDCROP_DETECTION_H
#define IDCROP_DETECTION_H

#include "geometry.h"
#include <vector>

namespace idcrop {

// One candidate face: absolute box plus detector confidence in [0, 1]
struct Detection {
    Box box;
    float score = 0.0f;
};

// Unordered as produced by a backend; ranked after selectDetections()
using DetectionSet = std::vector<Detection>;

} // namespace idcrop

#endif // IDCROP_DETECTION_H
