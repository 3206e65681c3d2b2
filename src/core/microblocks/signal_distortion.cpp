#include "signal_distortion.h"
#include "artifact_synth.h"
#include <algorithm>
#include <random>
#include <string>

namespace crtmix {

namespace {

void require(bool ok, const std::string& what) {
  if (!ok) throw Error(ErrorKind::UnsupportedParameter, what);
}

} // namespace

PixelBuffer SignalDistortion::scanline_shift(const PixelBuffer& src, int max_shift, double probability, Rng& rng) {
  require(max_shift >= 0, "scanline shift must not be negative");
  require(probability >= 0.0 && probability <= 1.0, "scanline shift probability outside [0, 1]");

  PixelBuffer dst = src;
  std::uniform_real_distribution<double> u(0.0, 1.0);
  std::uniform_int_distribution<int> amount(-max_shift, max_shift);
  for (int y = 0; y < dst.height(); ++y) {
    if (u(rng) < probability) {
      roll_pixels(dst.row(y), dst.width(), amount(rng));
    }
  }
  return dst;
}

PixelBuffer SignalDistortion::signal_noise(const PixelBuffer& src, double amount, Rng& rng) {
  require(amount >= 0.0 && amount <= 1.0, "signal noise amount outside [0, 1]");
  if (amount == 0.0) return src;

  std::normal_distribution<double> noise(0.0, amount * 255.0);
  PixelBuffer dst(src.width(), src.height());
  const Rgb* s = src.data();
  Rgb* d = dst.data();
  for (size_t i = 0; i < src.size(); ++i) {
    d[i].r = clamp_u8(s[i].r + noise(rng));
    d[i].g = clamp_u8(s[i].g + noise(rng));
    d[i].b = clamp_u8(s[i].b + noise(rng));
  }
  return dst;
}

PixelBuffer SignalDistortion::interlacing(const PixelBuffer& src, double strength) {
  require(strength >= 0.0 && strength <= 1.0, "interlacing strength outside [0, 1]");
  PixelBuffer dst = src;
  const double keep = 1.0 - strength * 0.3;
  for (int y = 0; y < dst.height(); y += 2) {
    Rgb* row = dst.row(y);
    for (int x = 0; x < dst.width(); ++x) {
      row[x].r = clamp_u8(row[x].r * keep);
      row[x].g = clamp_u8(row[x].g * keep);
      row[x].b = clamp_u8(row[x].b * keep);
    }
  }
  return dst;
}

PixelBuffer SignalDistortion::vertical_hold(const PixelBuffer& src, int shift) {
  const int h = src.height();
  if (h == 0) return src;
  const int s = ((shift % h) + h) % h;
  if (s == 0) return src;

  PixelBuffer dst(src.width(), h);
  for (int y = 0; y < h; ++y) {
    const Rgb* from = src.row(y);
    std::copy(from, from + src.width(), dst.row((y + s) % h));
  }
  return dst;
}

PixelBuffer SignalDistortion::chroma_smear(const PixelBuffer& src, int amount) {
  require(amount >= 0, "chroma smear amount must not be negative");
  PixelBuffer dst = src;
  const int w = src.width();
  const int window = 2 * amount + 1;
  for (int y = 0; y < src.height(); ++y) {
    const Rgb* s = src.row(y);
    Rgb* d = dst.row(y);
    for (int x = amount; x < w - amount; ++x) {
      int sum_r = 0;
      int sum_b = 0;
      for (int i = x - amount; i <= x + amount; ++i) {
        sum_r += s[i].r;
        sum_b += s[i].b;
      }
      d[x].r = static_cast<uint8_t>(sum_r / window);
      d[x].b = static_cast<uint8_t>(sum_b / window);
    }
  }
  return dst;
}

PixelBuffer SignalDistortion::signal_dropout(const PixelBuffer& src, int block_count, int block_size, Rng& rng) {
  require(block_count >= 0, "dropout block count must not be negative");
  require(block_size >= 10, "dropout block size must be at least 10");

  PixelBuffer dst = src;
  const int w = dst.width();
  const int h = dst.height();
  if (dst.empty()) return dst;

  std::uniform_int_distribution<int> px(0, w - 1);
  std::uniform_int_distribution<int> py(0, h - 1);
  std::uniform_int_distribution<int> bw(10, block_size);
  std::uniform_int_distribution<int> bh(5, std::max(5, block_size / 2));
  std::uniform_real_distribution<double> coin(0.0, 1.0);
  std::uniform_int_distribution<int> byte(0, 254);

  for (int i = 0; i < block_count; ++i) {
    const int x = px(rng);
    const int y = py(rng);
    const int x1 = std::min(x + bw(rng), w);
    const int y1 = std::min(y + bh(rng), h);
    const bool black = coin(rng) < 0.5;
    for (int r = y; r < y1; ++r) {
      Rgb* row = dst.row(r);
      for (int c = x; c < x1; ++c) {
        if (black) {
          row[c] = Rgb{};
        } else {
          row[c].r = static_cast<uint8_t>(byte(rng));
          row[c].g = static_cast<uint8_t>(byte(rng));
          row[c].b = static_cast<uint8_t>(byte(rng));
        }
      }
    }
  }
  return dst;
}

} // namespace crtmix
