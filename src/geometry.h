#ifndef IDCROP_GEOMETRY_H
#define IDCROP_GEOMETRY_H

#include <climits>
#include <ostream>
#include <string>

namespace idcrop {

// Absolute pixel box: left/top inclusive, right/bottom exclusive
struct Box {
    int x1, y1, x2, y2;

    constexpr Box() noexcept : x1(0), y1(0), x2(0), y2(0) {}
    constexpr Box(int x1_, int y1_, int x2_, int y2_) noexcept
        : x1(x1_), y1(y1_), x2(x2_), y2(y2_) {}

    // Only for boxes known to fit the int range (e.g. after clipBox)
    constexpr int width() const noexcept { return x2 - x1; }
    constexpr int height() const noexcept { return y2 - y1; }

    // 64-bit extents, valid for any corners
    constexpr long long extentX() const noexcept { return static_cast<long long>(x2) - x1; }
    constexpr long long extentY() const noexcept { return static_cast<long long>(y2) - y1; }

    constexpr bool empty() const noexcept {
        return x2 <= x1 || y2 <= y1;
    }

    // Area as used for ranking (64-bit: 40k x 40k images overflow int).
    // Saturates for corners spanning the whole int range.
    constexpr long long area() const noexcept {
        if (empty()) return 0LL;
        if (extentX() > LLONG_MAX / extentY()) return LLONG_MAX;
        return extentX() * extentY();
    }

    constexpr bool operator==(const Box& other) const noexcept {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
    constexpr bool operator!=(const Box& other) const noexcept {
        return !(*this == other);
    }

    std::string toString() const;
};

inline std::ostream& operator<<(std::ostream& os, const Box& box) {
    return os << box.toString();
}

// Box in fractions of the detector input, as produced by dense detectors
struct RelativeBox {
    float xmin, ymin, width, height;
};

// Clamp corners to [0, W-1] x [0, H-1], then repair degenerate extents
// so that x2 = min(W-1, x1+1) / y2 = min(H-1, y1+1) when collapsed. A box
// collapsed onto the last column/row becomes (W-2, W-1) / (H-2, H-1).
// Result: 0 <= x1 < x2 <= W-1 and 0 <= y1 < y2 <= H-1 whenever W, H >= 2.
Box clipBox(int x1, int y1, int x2, int y2, int width, int height) noexcept;

inline Box clipBox(const Box& box, int width, int height) noexcept {
    return clipBox(box.x1, box.y1, box.x2, box.y2, width, height);
}

// Grow the box on every side by floor(extent * margin_percent / 100).
// Negative margins are treated as 0. The result is not clipped.
Box expandBox(const Box& box, int margin_percent) noexcept;

// round(rel * W) for both corners, then clipBox
Box toAbsoluteBox(const RelativeBox& rel, int width, int height) noexcept;

} // namespace idcrop

#endif // IDCROP_GEOMETRY_H
