#include "include/crtmix.hpp"
#include <atomic>
#include <string>
#include <utility>

namespace crtmix {

namespace {
std::atomic<bool> g_verbose{true};
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidImage: return "invalid_image";
    case ErrorKind::UnsupportedParameter: return "unsupported_parameter";
    case ErrorKind::EncodeFailure: return "encode_failure";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

PixelBuffer::PixelBuffer(int width, int height) {
    if (width < 0 || height < 0) {
        throw Error(ErrorKind::UnsupportedParameter,
                    "negative buffer dimensions " + std::to_string(width) + "x" + std::to_string(height));
    }
    width_ = width;
    height_ = height;
    pixels_.assign(static_cast<size_t>(width) * height, Rgb{});
}

PixelBuffer::PixelBuffer(int width, int height, std::vector<Rgb> pixels) {
    if (width < 0 || height < 0) {
        throw Error(ErrorKind::UnsupportedParameter,
                    "negative buffer dimensions " + std::to_string(width) + "x" + std::to_string(height));
    }
    if (pixels.size() != static_cast<size_t>(width) * height) {
        throw Error(ErrorKind::InvalidImage,
                    "pixel count " + std::to_string(pixels.size()) + " does not match " +
                    std::to_string(width) + "x" + std::to_string(height));
    }
    width_ = width;
    height_ = height;
    pixels_ = std::move(pixels);
}

PixelBuffer transpose(const PixelBuffer& src) {
    PixelBuffer dst(src.height(), src.width());
    for (int y = 0; y < src.height(); ++y) {
        const Rgb* s = src.row(y);
        for (int x = 0; x < src.width(); ++x) {
            dst.at(y, x) = s[x];
        }
    }
    return dst;
}

Rng make_rng(bool has_seed, uint64_t seed) {
    if (has_seed) return Rng(seed);
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return Rng(seq);
}

void set_verbose(bool on) { g_verbose.store(on, std::memory_order_relaxed); }
bool verbose() { return g_verbose.load(std::memory_order_relaxed); }

} // namespace crtmix
