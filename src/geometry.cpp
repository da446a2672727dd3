#include "geometry.h"
#include <algorithm>
#include <climits>
#include <cmath>

namespace idcrop {

namespace {

int clampToInt(long long value) {
    return static_cast<int>(std::max<long long>(INT_MIN, std::min<long long>(INT_MAX, value)));
}

// round(fraction * extent), saturated to the int range; NaN maps to 0
int scaleRound(float fraction, int extent) {
    double scaled = static_cast<double>(fraction) * extent;
    if (std::isnan(scaled)) {
        return 0;
    }
    scaled = std::max(-1e9, std::min(1e9, scaled));
    return static_cast<int>(std::lround(scaled));
}

} // namespace

std::string Box::toString() const {
    return "(" + std::to_string(x1) + "," + std::to_string(y1) + "," +
           std::to_string(x2) + "," + std::to_string(y2) + ")";
}

Box clipBox(int x1, int y1, int x2, int y2, int width, int height) noexcept {
    const int max_x = std::max(0, width - 1);
    const int max_y = std::max(0, height - 1);

    // Clamp first, then fix collapsed extents
    x1 = std::max(0, std::min(x1, max_x));
    y1 = std::max(0, std::min(y1, max_y));
    x2 = std::max(0, std::min(x2, max_x));
    y2 = std::max(0, std::min(y2, max_y));

    if (x2 <= x1) {
        x2 = std::min(max_x, x1 + 1);
    }
    if (y2 <= y1) {
        y2 = std::min(max_y, y1 + 1);
    }

    // Still collapsed only when x1 sits on the last column: grow leftwards
    if (x2 <= x1) {
        x1 = std::max(0, x2 - 1);
    }
    if (y2 <= y1) {
        y1 = std::max(0, y2 - 1);
    }

    return Box(x1, y1, x2, y2);
}

Box expandBox(const Box& box, int margin_percent) noexcept {
    const long long margin = std::max(0, margin_percent);
    const long long bw = std::max(0LL, box.extentX());
    const long long bh = std::max(0LL, box.extentY());

    // Non-negative operands: integer division is floor
    const long long mx = bw * margin / 100;
    const long long my = bh * margin / 100;

    return Box(clampToInt(box.x1 - mx), clampToInt(box.y1 - my),
               clampToInt(box.x2 + mx), clampToInt(box.y2 + my));
}

Box toAbsoluteBox(const RelativeBox& rel, int width, int height) noexcept {
    int x1 = scaleRound(rel.xmin, width);
    int y1 = scaleRound(rel.ymin, height);
    int x2 = scaleRound(rel.xmin + rel.width, width);
    int y2 = scaleRound(rel.ymin + rel.height, height);
    return clipBox(x1, y1, x2, y2, width, height);
}

} // namespace idcrop
