#include "image_codec.h"
#include "image_ops.h"
#include "errors.h"
#include "logger.h"
#include <turbojpeg.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>

// stb_image for PNG/BMP/GIF/... (header-only library)
#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

namespace idcrop {

namespace {

// Owns a TurboJPEG handle for the duration of one call
class TurboJpegHandle {
public:
    explicit TurboJpegHandle(tjhandle handle) noexcept : handle_(handle) {}
    ~TurboJpegHandle() {
        if (handle_) {
            tjDestroy(handle_);
        }
    }

    TurboJpegHandle(const TurboJpegHandle&) = delete;
    TurboJpegHandle& operator=(const TurboJpegHandle&) = delete;

    tjhandle get() const noexcept { return handle_; }
    explicit operator bool() const noexcept { return handle_ != nullptr; }

private:
    tjhandle handle_;
};

Image decodeJpeg(const uint8_t* data, size_t size) {
    TurboJpegHandle tj(tjInitDecompress());
    if (!tj) {
        throw DecodeError("Failed to initialize TurboJPEG decompressor");
    }

    int width = 0, height = 0, subsamp = 0, colorspace = 0;
    if (tjDecompressHeader3(tj.get(), data, static_cast<unsigned long>(size),
                            &width, &height, &subsamp, &colorspace) < 0) {
        throw DecodeError("Invalid JPEG header: " + std::string(tjGetErrorStr2(tj.get())));
    }
    if (width <= 0 || height <= 0) {
        throw DecodeError("JPEG has no pixels");
    }

    Image image(width, height, 3);
    if (tjDecompress2(tj.get(), data, static_cast<unsigned long>(size),
                      image.data(), width, image.stride(), height,
                      TJPF_BGR, TJFLAG_ACCURATEDCT) < 0) {
        throw DecodeError("JPEG decode failed: " + std::string(tjGetErrorStr2(tj.get())));
    }
    return image;
}

Image decodeWebp(const uint8_t* data, size_t size) {
    cv::Mat encoded(1, static_cast<int>(size), CV_8UC1, const_cast<uint8_t*>(data));
    cv::Mat decoded;
    try {
        decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeError("WEBP decode failed: " + std::string(e.what()));
    }
    if (decoded.empty() || decoded.type() != CV_8UC3) {
        throw DecodeError("WEBP decode failed");
    }

    Image image(decoded.cols, decoded.rows, 3);
    for (int y = 0; y < decoded.rows; y++) {
        std::memcpy(image.data() + y * image.stride(), decoded.ptr<uint8_t>(y),
                    static_cast<size_t>(decoded.cols) * 3);
    }
    return image;
}

Image decodeWithStb(const uint8_t* data, size_t size) {
    int width = 0, height = 0, channels = 0;
    unsigned char* pixels = stbi_load_from_memory(data, static_cast<int>(size),
                                                  &width, &height, &channels, 3);  // Force RGB
    if (!pixels) {
        throw DecodeError("Unsupported or corrupt image: " + std::string(stbi_failure_reason()));
    }

    std::unique_ptr<unsigned char, void (*)(void*)> owned(pixels, stbi_image_free);

    // stb hands out RGB; the rest of the pipeline is BGR
    ImageView rgb(owned.get(), width, height, 3);
    return swapRedBlue(rgb);
}

} // namespace

ImageFormat detectImageFormat(const uint8_t* data, size_t size) {
    if (size >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::JPEG;
    }
    static const uint8_t png_magic[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (size >= 8 && std::memcmp(data, png_magic, 8) == 0) {
        return ImageFormat::PNG;
    }
    if (size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WEBP", 4) == 0) {
        return ImageFormat::WEBP;
    }
    return ImageFormat::OTHER;
}

Image decodeImage(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw DecodeError("Empty image data");
    }
    if (size > static_cast<size_t>(INT32_MAX)) {
        throw DecodeError("Image data too large");
    }

    Image image;
    switch (detectImageFormat(data, size)) {
        case ImageFormat::JPEG:
            image = decodeJpeg(data, size);
            break;
        case ImageFormat::WEBP:
            image = decodeWebp(data, size);
            break;
        case ImageFormat::PNG:
        case ImageFormat::OTHER:
            image = decodeWithStb(data, size);
            break;
    }

    Logger::getInstance().debug("Decoded image " + std::to_string(image.width()) + "x" +
                                std::to_string(image.height()));
    return image;
}

Bytes encodeJpeg(const ImageView& image, int quality) {
    if (image.empty()) {
        throw EncodeError("Cannot encode an empty image");
    }

    int pixel_format = 0;
    int subsamp = TJSAMP_420;
    if (image.channels() == 3) {
        pixel_format = TJPF_BGR;
    } else if (image.channels() == 1) {
        pixel_format = TJPF_GRAY;
        subsamp = TJSAMP_GRAY;
    } else {
        throw EncodeError("Unsupported channel count: " + std::to_string(image.channels()));
    }

    TurboJpegHandle tj(tjInitCompress());
    if (!tj) {
        throw EncodeError("Failed to initialize TurboJPEG compressor");
    }

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;
    quality = std::max(1, std::min(100, quality));

    if (tjCompress2(tj.get(), image.data(), image.width(), image.stride(), image.height(),
                    pixel_format, &jpeg_buf, &jpeg_size, subsamp, quality,
                    TJFLAG_ACCURATEDCT) < 0) {
        std::string reason = tjGetErrorStr2(tj.get());
        tjFree(jpeg_buf);
        throw EncodeError("JPEG encode failed: " + reason);
    }

    Bytes out(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    return out;
}

Bytes readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DecodeError("Cannot open image file: " + path);
    }

    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw DecodeError("Failed to read image file: " + path);
    }
    return bytes;
}

bool writeFile(const std::string& path, const Bytes& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        Logger::getInstance().error("Cannot open output file: " + path);
        return false;
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        Logger::getInstance().error("Failed to write output file: " + path);
        return false;
    }
    return true;
}

} // namespace idcrop
