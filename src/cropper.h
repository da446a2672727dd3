#ifndef IDCROP_CROPPER_H
#define IDCROP_CROPPER_H

#include "geometry.h"
#include "image.h"
#include <vector>

namespace idcrop {

// Expand each box by margin_percent (clamped to >= 0), clip it to the image
// and copy the region out. Regions with zero area after clipping are
// dropped, so the result may be shorter than `boxes`. Crops are deep copies
// and never alias `image`.
std::vector<Image> cropRegions(const ImageView& image, const std::vector<Box>& boxes,
                               int margin_percent = 10);

// The clipped region cropRegions() would extract for one box
Box cropBoxFor(const Box& box, int image_width, int image_height, int margin_percent);

} // namespace idcrop

#endif // IDCROP_CROPPER_H
