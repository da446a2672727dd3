#include "cropper.h"
#include "logger.h"

namespace idcrop {

Box cropBoxFor(const Box& box, int image_width, int image_height, int margin_percent) {
    return clipBox(expandBox(box, margin_percent), image_width, image_height);
}

std::vector<Image> cropRegions(const ImageView& image, const std::vector<Box>& boxes,
                               int margin_percent) {
    std::vector<Image> crops;
    if (image.empty()) {
        return crops;
    }

    crops.reserve(boxes.size());
    for (const Box& box : boxes) {
        Box region = cropBoxFor(box, image.width(), image.height(), margin_percent);
        if (region.empty()) {
            Logger::getInstance().debug("Dropping zero-area crop for box " + box.toString());
            continue;
        }

        crops.push_back(image.roi(region.x1, region.y1, region.width(), region.height()).clone());
    }

    return crops;
}

} // namespace idcrop
