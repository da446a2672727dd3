#include "overlay.h"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>

namespace idcrop {

namespace {

cv::Mat asMat(Image& img) {
    if (img.channels() != 3) {
        throw std::invalid_argument("Overlay drawing expects a 3-channel BGR image");
    }
    return cv::Mat(img.height(), img.width(), CV_8UC3, img.data(), img.stride());
}

cv::Scalar toScalar(const Color& color) {
    return cv::Scalar(color.b, color.g, color.r);
}

} // namespace

void drawRectangle(Image& img, const Box& box, const Color& color, int thickness) {
    cv::Mat mat = asMat(img);
    cv::rectangle(mat, cv::Point(box.x1, box.y1), cv::Point(box.x2, box.y2),
                  toScalar(color), thickness);
}

void drawText(Image& img, const std::string& text, int x, int y,
              const Color& color, double scale, int thickness) {
    cv::Mat mat = asMat(img);
    cv::putText(mat, text, cv::Point(x, y), cv::FONT_HERSHEY_SIMPLEX, scale,
                toScalar(color), thickness);
}

Image drawDetections(const ImageView& image, const std::vector<Box>& boxes, size_t main_index) {
    Image vis = image.clone();
    if (vis.empty()) {
        return vis;
    }

    for (size_t i = 0; i < boxes.size(); i++) {
        const Box& box = boxes[i];
        const bool is_main = (i == main_index);
        const Color color = is_main ? Color::MainFace() : Color::OtherFace();

        drawRectangle(vis, box, color, 2);
        // Keep the label on screen for boxes touching the top edge
        drawText(vis, is_main ? "main" : "face", box.x1, std::max(box.y1 - 5, 10), color, 0.6, 2);
    }

    return vis;
}

} // namespace idcrop
