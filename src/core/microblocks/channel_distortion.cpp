#include "channel_distortion.h"
#include <opencv2/core.hpp>
#include <string>

namespace crtmix {

namespace {

inline uint8_t channel(const Rgb& p, int c) {
  return c == 0 ? p.r : (c == 1 ? p.g : p.b);
}

inline bool inside(const PixelBuffer& b, int x, int y) {
  return x >= 0 && x < b.width() && y >= 0 && y < b.height();
}

} // namespace

std::array<int, 3> ChannelSwap::order(ChannelSwapMode mode) {
  switch (mode) {
  case ChannelSwapMode::RGB: return {{0, 1, 2}};
  case ChannelSwapMode::RBG: return {{0, 2, 1}};
  case ChannelSwapMode::GRB: return {{1, 0, 2}};
  case ChannelSwapMode::GBR: return {{1, 2, 0}};
  case ChannelSwapMode::BRG: return {{2, 0, 1}};
  case ChannelSwapMode::BGR: return {{2, 1, 0}};
  }
  throw Error(ErrorKind::UnsupportedParameter, "unknown channel swap mode");
}

ChannelSwap::ChannelSwap(ChannelSwapMode mode) : order_(order(mode)) {}

PixelBuffer ChannelSwap::process(const PixelBuffer& src) const {
  PixelBuffer dst(src.width(), src.height());
  const Rgb* s = src.data();
  Rgb* d = dst.data();
  for (size_t i = 0; i < src.size(); ++i) {
    d[i].r = channel(s[i], order_[0]);
    d[i].g = channel(s[i], order_[1]);
    d[i].b = channel(s[i], order_[2]);
  }
  return dst;
}

ChannelShift::ChannelShift(ChannelOffset red, ChannelOffset green, ChannelOffset blue)
  : red_(red), green_(green), blue_(blue) {}

PixelBuffer ChannelShift::process(const PixelBuffer& src) const {
  PixelBuffer dst(src.width(), src.height());
  cv::parallel_for_(cv::Range(0, src.height()), [&](const cv::Range& r) {
    for (int y = r.start; y < r.end; ++y) {
      Rgb* d = dst.row(y);
      for (int x = 0; x < src.width(); ++x) {
        int sx = x - red_.dx, sy = y - red_.dy;
        if (inside(src, sx, sy)) d[x].r = src.at(sx, sy).r;
        sx = x - green_.dx; sy = y - green_.dy;
        if (inside(src, sx, sy)) d[x].g = src.at(sx, sy).g;
        sx = x - blue_.dx; sy = y - blue_.dy;
        if (inside(src, sx, sy)) d[x].b = src.at(sx, sy).b;
      }
    }
  });
  return dst;
}

ChromaticAberration::ChromaticAberration(int strength) : strength_(strength) {
  if (strength < 0) {
    throw Error(ErrorKind::UnsupportedParameter,
                "chromatic aberration strength " + std::to_string(strength) + " is negative");
  }
}

PixelBuffer ChromaticAberration::process(const PixelBuffer& src) const {
  PixelBuffer dst(src.width(), src.height());
  if (src.empty()) return dst;

  const double cx = src.width() / 2.0;
  const double cy = src.height() / 2.0;
  const double k = static_cast<double>(strength_);

  cv::parallel_for_(cv::Range(0, src.height()), [&](const cv::Range& r) {
    for (int y = r.start; y < r.end; ++y) {
      Rgb* d = dst.row(y);
      const double dy = (y - cy) / cy;
      for (int x = 0; x < src.width(); ++x) {
        const double dx = (x - cx) / cx;

        // outward: offset +k
        int sx = static_cast<int>(x - dx * k);
        int sy = static_cast<int>(y - dy * k);
        if (inside(src, sx, sy)) d[x].r = src.at(sx, sy).r;

        d[x].g = src.at(x, y).g;

        // inward: offset -k
        sx = static_cast<int>(x + dx * k);
        sy = static_cast<int>(y + dy * k);
        if (inside(src, sx, sy)) d[x].b = src.at(sx, sy).b;
      }
    }
  });
  return dst;
}

ChannelScale::ChannelScale(float red, float green, float blue)
  : red_(red), green_(green), blue_(blue) {
  for (float s : {red, green, blue}) {
    if (!(s >= 0.0f && s <= 2.0f)) {
      throw Error(ErrorKind::UnsupportedParameter,
                  "channel scale " + std::to_string(s) + " outside [0, 2]");
    }
  }
}

PixelBuffer ChannelScale::process(const PixelBuffer& src) const {
  PixelBuffer dst(src.width(), src.height());
  const Rgb* s = src.data();
  Rgb* d = dst.data();
  for (size_t i = 0; i < src.size(); ++i) {
    d[i].r = clamp_u8(s[i].r * red_);
    d[i].g = clamp_u8(s[i].g * green_);
    d[i].b = clamp_u8(s[i].b * blue_);
  }
  return dst;
}

} // namespace crtmix
