#pragma once
#include "../../include/crtmix.hpp"
#include "../../include/effect_config.hpp"

namespace crtmix {

struct Hsv {
  double h = 0.0; // [0,360), 0 when max == min
  double s = 0.0; // 0 when max == 0, else (max-min)/max
  double v = 0.0; // [0,1]
};

// Unweighted mean of the three channels, [0,255]
inline double brightness(const Rgb& p) {
  return (static_cast<int>(p.r) + static_cast<int>(p.g) + static_cast<int>(p.b)) / 3.0;
}

Hsv rgb_to_hsv(const Rgb& p);

// Scalar sort key for a pixel
double sort_key_value(const Rgb& p, SortKey key);

} // namespace crtmix
