/*
 * Owning and non-owning image types for idcrop
 *
 * - ImageView: non-owning view (move-only, never copied implicitly)
 * - Image: owning buffer (move-only, explicit clone), 64-byte aligned
 *
 * Pixels are interleaved, 8 bits per channel. Color images are BGR
 * (OpenCV / libyuv "RGB24" memory order), grayscale images have 1 channel.
 */

#ifndef IDCROP_IMAGE_H
#define IDCROP_IMAGE_H

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>

namespace idcrop {

class Image;

// ========== ImageView: Non-Owning View ==========

class ImageView {
public:
    ImageView(uint8_t* data, int width, int height, int channels, int stride = 0) noexcept
        : data_(data), width_(width), height_(height),
          channels_(channels), stride_(stride > 0 ? stride : width * channels) {}

    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;

    ImageView(ImageView&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
    }

    ImageView& operator=(ImageView&& other) noexcept {
        data_ = other.data_;
        width_ = other.width_;
        height_ = other.height_;
        channels_ = other.channels_;
        stride_ = other.stride_;
        other.data_ = nullptr;
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ <= 0 || height_ <= 0; }

    // Caller guarantees the region lies inside the view
    ImageView roi(int x, int y, int w, int h) const noexcept {
        uint8_t* roi_data = data_ + y * stride_ + x * channels_;
        return ImageView(roi_data, w, h, channels_, stride_);
    }

    // Deep copy into a tightly packed owning image
    Image clone() const;

private:
    uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

// ========== Image: Owning Image (Move-Only) ==========

class Image {
public:
    Image() noexcept
        : data_(nullptr), width_(0), height_(0), channels_(0), stride_(0) {}

    Image(int width, int height, int channels)
        : width_(width), height_(height), channels_(channels),
          stride_(width * channels) {
        if (width <= 0 || height <= 0 || channels <= 0) {
            throw std::invalid_argument("Image dimensions must be positive");
        }

        size_t size = static_cast<size_t>(stride_) * height_;
        size_t aligned_size = (size + 63) & ~static_cast<size_t>(63);

        if (posix_memalign(reinterpret_cast<void**>(&data_), 64, aligned_size) != 0) {
            throw std::bad_alloc();
        }
        std::memset(data_, 0, aligned_size);
    }

    ~Image() noexcept {
        free(data_);
    }

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    Image(Image&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
        other.width_ = 0;
        other.height_ = 0;
    }

    Image& operator=(Image&& other) noexcept {
        if (this != &other) {
            free(data_);

            data_ = other.data_;
            width_ = other.width_;
            height_ = other.height_;
            channels_ = other.channels_;
            stride_ = other.stride_;

            other.data_ = nullptr;
            other.width_ = 0;
            other.height_ = 0;
        }
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ == 0 || height_ == 0; }
    constexpr size_t size() const noexcept { return static_cast<size_t>(width_) * height_ * channels_; }

    // View lifetime must not exceed the image lifetime
    ImageView view() noexcept {
        return ImageView(data_, width_, height_, channels_, stride_);
    }

    const ImageView view() const noexcept {
        return ImageView(const_cast<uint8_t*>(data_), width_, height_, channels_, stride_);
    }

    Image clone() const {
        return view().clone();
    }

private:
    uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

inline Image ImageView::clone() const {
    if (empty()) {
        return Image();
    }

    Image copy(width_, height_, channels_);

    // Row by row: the source may be a strided ROI
    for (int y = 0; y < height_; y++) {
        std::memcpy(
            copy.data() + y * copy.stride(),
            data_ + y * stride_,
            static_cast<size_t>(width_) * channels_
        );
    }

    return copy;
}

} // namespace idcrop

#endif // IDCROP_IMAGE_H
