#include "core/microblocks/color_metrics.h"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace crtmix;

static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) < eps; }

int main() {
  assert(near(brightness(Rgb{0, 0, 0}), 0.0));
  assert(near(brightness(Rgb{255, 255, 255}), 255.0));
  assert(near(brightness(Rgb{200, 0, 0}), 200.0 / 3.0));

  Hsv red = rgb_to_hsv(Rgb{255, 0, 0});
  assert(near(red.h, 0.0) && near(red.s, 1.0) && near(red.v, 1.0));
  Hsv green = rgb_to_hsv(Rgb{0, 255, 0});
  assert(near(green.h, 120.0));
  Hsv blue = rgb_to_hsv(Rgb{0, 0, 255});
  assert(near(blue.h, 240.0));
  // negative hue wraps into [0,360)
  Hsv magenta_ish = rgb_to_hsv(Rgb{255, 0, 128});
  assert(magenta_ish.h > 300.0 && magenta_ish.h < 360.0);

  Hsv grey = rgb_to_hsv(Rgb{128, 128, 128});
  assert(near(grey.h, 0.0) && near(grey.s, 0.0));
  Hsv black = rgb_to_hsv(Rgb{0, 0, 0});
  assert(near(black.s, 0.0) && near(black.v, 0.0));

  Rgb p{10, 20, 30};
  assert(near(sort_key_value(p, SortKey::Red), 10.0));
  assert(near(sort_key_value(p, SortKey::Green), 20.0));
  assert(near(sort_key_value(p, SortKey::Blue), 30.0));
  assert(near(sort_key_value(p, SortKey::Brightness), 20.0));
  assert(near(sort_key_value(p, SortKey::Hue), 210.0));
  assert(near(sort_key_value(p, SortKey::Saturation), 20.0 / 30.0));

  std::cout << "ColorMetrics test PASSED\n";
  return 0;
}
