#ifndef IDCROP_IMAGE_OPS_H
#define IDCROP_IMAGE_OPS_H

#include "image.h"

namespace idcrop {

// Bilinear resize of a 3-channel BGR image (libyuv, via ARGB)
Image resizeImage(const ImageView& src, int dst_width, int dst_height);

// BGR -> 8-bit grayscale, full range
Image toGrayscale(const ImageView& src);

// Swap first and third channel (RGB <-> BGR) into a new image
Image swapRedBlue(const ImageView& src);

} // namespace idcrop

#endif // IDCROP_IMAGE_OPS_H
