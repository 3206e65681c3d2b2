#include "color_metrics.h"
#include <algorithm>
#include <cmath>

namespace crtmix {

Hsv rgb_to_hsv(const Rgb& p) {
  const double r = p.r / 255.0;
  const double g = p.g / 255.0;
  const double b = p.b / 255.0;
  const double max_v = std::max(r, std::max(g, b));
  const double min_v = std::min(r, std::min(g, b));
  const double diff = max_v - min_v;

  Hsv out;
  if (diff == 0.0) {
    out.h = 0.0;
  } else if (max_v == r) {
    out.h = std::fmod(60.0 * ((g - b) / diff) + 360.0, 360.0);
  } else if (max_v == g) {
    out.h = std::fmod(60.0 * ((b - r) / diff) + 120.0, 360.0);
  } else {
    out.h = std::fmod(60.0 * ((r - g) / diff) + 240.0, 360.0);
  }
  out.s = max_v == 0.0 ? 0.0 : diff / max_v;
  out.v = max_v;
  return out;
}

double sort_key_value(const Rgb& p, SortKey key) {
  switch (key) {
  case SortKey::Brightness: return brightness(p);
  case SortKey::Red: return p.r;
  case SortKey::Green: return p.g;
  case SortKey::Blue: return p.b;
  case SortKey::Hue: return rgb_to_hsv(p).h;
  case SortKey::Saturation: return rgb_to_hsv(p).s;
  }
  return brightness(p);
}

} // namespace crtmix
