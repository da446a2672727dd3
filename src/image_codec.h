#ifndef IDCROP_IMAGE_CODEC_H
#define IDCROP_IMAGE_CODEC_H

#include "image.h"
#include <cstdint>
#include <string>
#include <vector>

namespace idcrop {

using Bytes = std::vector<uint8_t>;

enum class ImageFormat {
    JPEG,
    PNG,
    WEBP,
    OTHER
};

// Sniff the container from its magic bytes
ImageFormat detectImageFormat(const uint8_t* data, size_t size);

// Decode JPEG (TurboJPEG), WEBP (OpenCV) or anything stb_image reads
// into a 3-channel BGR image. Throws DecodeError.
Image decodeImage(const uint8_t* data, size_t size);

inline Image decodeImage(const Bytes& bytes) {
    return decodeImage(bytes.data(), bytes.size());
}

// Baseline JPEG, 4:2:0 subsampling. Accepts BGR or grayscale input.
// Throws EncodeError.
Bytes encodeJpeg(const ImageView& image, int quality = 95);

// Read a whole file; throws DecodeError if it can't be read
Bytes readFile(const std::string& path);

// Returns false (and logs) on I/O failure
bool writeFile(const std::string& path, const Bytes& bytes);

inline Image loadImageFile(const std::string& path) {
    return decodeImage(readFile(path));
}

} // namespace idcrop

#endif // IDCROP_IMAGE_CODEC_H
