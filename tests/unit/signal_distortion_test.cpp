#include "core/microblocks/signal_distortion.h"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <vector>

using namespace crtmix;

static PixelBuffer pattern(int w, int h) {
  PixelBuffer b(w, h);
  for (int y = 0; y < h; ++y)
    for (int x = 0; x < w; ++x)
      b.at(x, y) = Rgb{static_cast<uint8_t>(x * 3), static_cast<uint8_t>(y * 3), 200};
  return b;
}

static bool expect_unsupported(void (*fn)()) {
  try {
    fn();
  } catch (const Error& e) {
    return e.kind() == ErrorKind::UnsupportedParameter;
  }
  return false;
}

int main() {
  PixelBuffer img = pattern(40, 30);

  {
    Rng rng(1);
    assert(SignalDistortion::scanline_shift(img, 10, 0.0, rng) == img);
    Rng a(2), b(2);
    PixelBuffer x = SignalDistortion::scanline_shift(img, 10, 1.0, a);
    assert(x == SignalDistortion::scanline_shift(img, 10, 1.0, b));
    // each row is a rotation of itself
    for (int y = 0; y < 30; ++y) {
      std::vector<Rgb> in(img.row(y), img.row(y) + 40);
      std::vector<Rgb> out(x.row(y), x.row(y) + 40);
      bool rotation = false;
      for (int s = 0; s < 40 && !rotation; ++s) {
        std::rotate(in.begin(), in.begin() + 1, in.end());
        rotation = in == out;
      }
      assert(rotation);
    }
  }

  {
    Rng rng(3);
    assert(SignalDistortion::signal_noise(img, 0.0, rng) == img);
    assert(SignalDistortion::signal_noise(img, 0.2, rng) != img);
  }

  {
    PixelBuffer out = SignalDistortion::interlacing(img, 1.0);
    // even rows scaled by 0.7, odd rows untouched
    assert(out.at(0, 0).b >= 139 && out.at(0, 0).b <= 140);
    assert(out.at(5, 1) == img.at(5, 1));
    assert(SignalDistortion::interlacing(img, 0.0) == img);
  }

  {
    PixelBuffer out = SignalDistortion::vertical_hold(img, 5);
    assert(out.at(7, 5) == img.at(7, 0));
    assert(out.at(7, 0) == img.at(7, 25));
    assert(SignalDistortion::vertical_hold(img, 30) == img);
    assert(SignalDistortion::vertical_hold(SignalDistortion::vertical_hold(img, 7), -7) == img);
  }

  {
    PixelBuffer out = SignalDistortion::chroma_smear(img, 1);
    // red x*3 averaged over x-1..x+1 is x*3
    assert(out.at(10, 4).r == 30);
    assert(out.at(10, 4).g == img.at(10, 4).g);
    assert(out.at(0, 4) == img.at(0, 4));
    assert(SignalDistortion::chroma_smear(img, 0) == img);
  }

  {
    Rng a(4), b(4);
    PixelBuffer x = SignalDistortion::signal_dropout(img, 5, 20, a);
    assert(x == SignalDistortion::signal_dropout(img, 5, 20, b));
    assert(x != img);
    Rng rng(1);
    assert(SignalDistortion::signal_dropout(img, 0, 20, rng) == img);
  }

  assert(expect_unsupported([] {
    Rng rng(1);
    SignalDistortion::signal_dropout(pattern(4, 4), 1, 5, rng);
  }));
  assert(expect_unsupported([] {
    Rng rng(1);
    SignalDistortion::scanline_shift(pattern(4, 4), 2, 1.5, rng);
  }));
  assert(expect_unsupported([] { SignalDistortion::interlacing(pattern(4, 4), -0.5); }));
  assert(expect_unsupported([] { SignalDistortion::chroma_smear(pattern(4, 4), -1); }));

  std::cout << "SignalDistortion test PASSED\n";
  return 0;
}
