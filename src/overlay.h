/*
 * Detection overlay for idcrop
 *
 * Draws the selected boxes on a copy of the input image so a user can see
 * which face became the main portrait. Drawing goes through OpenCV
 * (cv::rectangle / cv::putText) on a cv::Mat header over our buffer.
 */

#ifndef IDCROP_OVERLAY_H
#define IDCROP_OVERLAY_H

#include "geometry.h"
#include "image.h"
#include <cstdint>
#include <string>
#include <vector>

namespace idcrop {

// ========== Color Struct (BGR order like OpenCV) ==========

struct Color {
    uint8_t b, g, r;

    constexpr Color(uint8_t b_, uint8_t g_, uint8_t r_) noexcept
        : b(b_), g(g_), r(r_) {}

    constexpr bool operator==(const Color& other) const noexcept {
        return b == other.b && g == other.g && r == other.r;
    }

    static constexpr Color MainFace()  { return Color(0, 255, 0); }
    static constexpr Color OtherFace() { return Color(255, 200, 0); }
};

// ========== Drawing Functions (Modify Image in-place) ==========

// Rectangle outline from (x1, y1) to (x2, y2) inclusive
void drawRectangle(Image& img, const Box& box, const Color& color, int thickness = 2);

// Hershey simplex text with its baseline at (x, y)
void drawText(Image& img, const std::string& text, int x, int y,
              const Color& color, double scale = 0.6, int thickness = 2);

// Copy of `image` with one box per entry of `boxes`. Index `main_index` is
// drawn green and labelled "main", the rest cyan-blue and labelled "face".
Image drawDetections(const ImageView& image, const std::vector<Box>& boxes, size_t main_index = 0);

} // namespace idcrop

#endif // IDCROP_OVERLAY_H
