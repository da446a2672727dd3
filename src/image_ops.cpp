#include "image_ops.h"
#include <libyuv.h>
#include <stdexcept>

namespace idcrop {

Image resizeImage(const ImageView& src, int dst_width, int dst_height) {
    if (src.channels() != 3) {
        throw std::invalid_argument("resizeImage expects a 3-channel image");
    }
    if (src.width() == dst_width && src.height() == dst_height) {
        return src.clone();
    }

    // libyuv scales ARGB; go through it and back
    Image src_argb(src.width(), src.height(), 4);
    libyuv::RGB24ToARGB(src.data(), src.stride(), src_argb.data(), src_argb.stride(),
                        src.width(), src.height());

    Image dst_argb(dst_width, dst_height, 4);
    libyuv::ARGBScale(
        src_argb.data(), src_argb.stride(),
        src_argb.width(), src_argb.height(),
        dst_argb.data(), dst_argb.stride(),
        dst_argb.width(), dst_argb.height(),
        libyuv::kFilterBilinear
    );

    Image result(dst_width, dst_height, 3);
    libyuv::ARGBToRGB24(dst_argb.data(), dst_argb.stride(), result.data(), result.stride(),
                        dst_width, dst_height);
    return result;
}

Image toGrayscale(const ImageView& src) {
    if (src.channels() == 1) {
        return src.clone();
    }
    if (src.channels() != 3) {
        throw std::invalid_argument("toGrayscale expects a 1- or 3-channel image");
    }

    // libyuv RGB24 is B,G,R in memory; J400 is full-range luma
    Image gray(src.width(), src.height(), 1);
    libyuv::RGB24ToJ400(src.data(), src.stride(), gray.data(), gray.stride(),
                        src.width(), src.height());
    return gray;
}

Image swapRedBlue(const ImageView& src) {
    if (src.channels() != 3) {
        throw std::invalid_argument("swapRedBlue expects a 3-channel image");
    }

    // RAW (R,G,B in memory) -> RGB24 (B,G,R in memory); symmetric
    Image dst(src.width(), src.height(), 3);
    libyuv::RAWToRGB24(src.data(), src.stride(), dst.data(), dst.stride(),
                       src.width(), src.height());
    return dst;
}

} // namespace idcrop
