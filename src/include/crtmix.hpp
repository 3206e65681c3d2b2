#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace crtmix {

// Rgb: one 8-bit pixel, channel order R,G,B
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Rgb& a, const Rgb& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }

enum class ErrorKind : uint8_t {
    InvalidImage = 0,
    UnsupportedParameter = 1,
    EncodeFailure = 2,
};

const char* to_string(ErrorKind kind);

// Error: the one exception type raised by every stage
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what);
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// PixelBuffer: owned row-major RGB image, origin top-left.
// pixels().size() == width*height always holds.
class PixelBuffer {
public:
    PixelBuffer() = default;
    // zero-filled (black) buffer
    PixelBuffer(int width, int height);
    // adopts pixels; throws InvalidImage when the count disagrees with width*height
    PixelBuffer(int width, int height, std::vector<Rgb> pixels);

    int width() const { return width_; }
    int height() const { return height_; }
    size_t size() const { return pixels_.size(); }
    bool empty() const { return pixels_.empty(); }

    Rgb& at(int x, int y) { return pixels_[static_cast<size_t>(y) * width_ + x]; }
    const Rgb& at(int x, int y) const { return pixels_[static_cast<size_t>(y) * width_ + x]; }

    Rgb* row(int y) { return pixels_.data() + static_cast<size_t>(y) * width_; }
    const Rgb* row(int y) const { return pixels_.data() + static_cast<size_t>(y) * width_; }

    Rgb* data() { return pixels_.data(); }
    const Rgb* data() const { return pixels_.data(); }
    const std::vector<Rgb>& pixels() const { return pixels_; }

    bool operator==(const PixelBuffer& o) const {
        return width_ == o.width_ && height_ == o.height_ && pixels_ == o.pixels_;
    }
    bool operator!=(const PixelBuffer& o) const { return !(*this == o); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Rgb> pixels_;
};

// Swap rows and columns; transpose(transpose(b)) == b
PixelBuffer transpose(const PixelBuffer& src);

inline uint8_t clamp_u8(int v) {
    return static_cast<uint8_t>(v < 0 ? 0 : (v > 255 ? 255 : v));
}

// Truncating 8-bit quantization of an unnormalized channel value
inline uint8_t clamp_u8(double v) {
    if (!(v > 0.0)) return 0;
    if (v >= 255.0) return 255;
    return static_cast<uint8_t>(v);
}

// Random source threaded explicitly through the stochastic stages
using Rng = std::mt19937_64;

// Seeded generator when has_seed, otherwise seeded from std::random_device
Rng make_rng(bool has_seed, uint64_t seed);

// Event logging switch for the component-prefixed log lines
void set_verbose(bool on);
bool verbose();

} // namespace crtmix
