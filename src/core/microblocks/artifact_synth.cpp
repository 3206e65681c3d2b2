#include "artifact_synth.h"
#include "../../image_io.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <random>
#include <string>

namespace crtmix {

namespace {

// floor division, matching the sign convention of the ranges below
inline int floor_div(int a, int b) {
  int q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

// uniform integer in [lo, hi)
inline int rand_range(Rng& rng, int lo, int hi) {
  if (hi <= lo) return lo;
  return std::uniform_int_distribution<int>(lo, hi - 1)(rng);
}

void roll_channel(std::vector<uint8_t>& plane, int width, int height, int shift) {
  if (width <= 0) return;
  const int s = ((shift % width) + width) % width;
  if (s == 0) return;
  for (int y = 0; y < height; ++y) {
    auto first = plane.begin() + static_cast<size_t>(y) * width;
    std::rotate(first, first + (width - s), first + width);
  }
}

} // namespace

void roll_pixels(Rgb* first, int n, int shift) {
  if (n <= 0) return;
  const int s = ((shift % n) + n) % n;
  if (s == 0) return;
  std::rotate(first, first + (n - s), first + n);
}

ArtifactSynthesizer::ArtifactSynthesizer(ArtifactType type, float intensity)
  : type_(type), intensity_(intensity) {
  if (!(intensity >= 0.0f && intensity <= 1.0f)) {
    throw Error(ErrorKind::UnsupportedParameter,
                "artifact intensity " + std::to_string(intensity) + " outside [0, 1]");
  }
}

int ArtifactSynthesizer::jpeg_quality(float intensity) {
  const int q = static_cast<int>(100.0 - intensity * 90.0);
  return std::max(1, std::min(100, q));
}

PixelBuffer ArtifactSynthesizer::process(const PixelBuffer& src, Rng& rng) const {
  if (src.empty()) return src;
  switch (type_) {
  case ArtifactType::Jpeg: return jpeg(src);
  case ArtifactType::Vhs: return vhs(src, rng);
  case ArtifactType::DigitalGlitch: return digital_glitch(src, rng);
  case ArtifactType::ColorBleed: return color_bleed(src);
  }
  return src;
}

PixelBuffer ArtifactSynthesizer::jpeg(const PixelBuffer& src) const {
  const int quality = jpeg_quality(intensity_);
  std::vector<uchar> encoded;
  const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, quality};
  try {
    if (!cv::imencode(".jpg", to_mat(src), encoded, params)) {
      throw Error(ErrorKind::EncodeFailure, "jpeg encoder rejected image at quality " + std::to_string(quality));
    }
    cv::Mat decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
    if (decoded.empty()) {
      throw Error(ErrorKind::EncodeFailure, "jpeg round trip produced no image");
    }
    return from_mat(decoded);
  } catch (const cv::Exception& e) {
    throw Error(ErrorKind::EncodeFailure, std::string("jpeg round trip failed: ") + e.what());
  }
}

PixelBuffer ArtifactSynthesizer::vhs(const PixelBuffer& src, Rng& rng) const {
  PixelBuffer img = src;
  const int w = img.width();
  const int h = img.height();
  const float k = intensity_;

  // tracking errors: displaced horizontal bands, blanked where uncovered
  if (k > 0.1f) {
    const int lines = static_cast<int>(k * 30);
    std::vector<Rgb> band;
    for (int i = 0; i < lines; ++i) {
      const int y = rand_range(rng, 0, h);
      const int band_h = rand_range(rng, 1, static_cast<int>(5 * k) + 1);
      const int shift = static_cast<int>(rand_range(rng, -20, 20) * k);
      if (y + band_h >= h) continue;

      for (int r = y; r < y + band_h; ++r) {
        Rgb* row = img.row(r);
        band.assign(row, row + w);
        std::fill(row, row + w, Rgb{});
        if (shift > 0 && shift < w) {
          std::copy(band.begin(), band.end() - shift, row + shift);
        } else if (shift < 0 && -shift < w) {
          std::copy(band.begin() - shift, band.end(), row);
        }
      }
    }
  }

  // chroma shear: red right, blue left
  if (k > 0.2f) {
    const int s = static_cast<int>(3 * k);
    if (s > 0 && s < w) {
      for (int y = 0; y < h; ++y) {
        Rgb* row = img.row(y);
        for (int x = w - 1; x >= s; --x) row[x].r = row[x - s].r;
        for (int x = 0; x < w - s; ++x) row[x].b = row[x + s].b;
      }
    }
  }

  if (k > 0.3f) {
    std::normal_distribution<double> noise(0.0, k * 10.0);
    Rgb* d = img.data();
    for (size_t i = 0; i < img.size(); ++i) {
      d[i].r = clamp_u8(d[i].r + noise(rng));
      d[i].g = clamp_u8(d[i].g + noise(rng));
      d[i].b = clamp_u8(d[i].b + noise(rng));
    }
  }
  return img;
}

PixelBuffer ArtifactSynthesizer::digital_glitch(const PixelBuffer& src, Rng& rng) const {
  enum Corruption { Repeat = 0, Shift = 1, Zero = 2, Noise = 3 };

  PixelBuffer img = src;
  const int w = img.width();
  const int h = img.height();
  const float k = intensity_;
  std::uniform_int_distribution<int> byte(0, 255);

  const int blocks = static_cast<int>(k * 50);
  for (int i = 0; i < blocks; ++i) {
    const int bw = rand_range(rng, 8, static_cast<int>(80 * k) + 8);
    const int bh = rand_range(rng, 8, static_cast<int>(60 * k) + 8);
    const int x = rand_range(rng, 0, std::max(1, w - bw));
    const int y = rand_range(rng, 0, std::max(1, h - bh));
    const int corruption = rand_range(rng, 0, 4);

    // block clipped to the image
    const int x1 = std::min(x + bw, w);
    const int y1 = std::min(y + bh, h);
    const int cw = x1 - x;

    switch (corruption) {
    case Repeat:
      if (x == 0) break;
      for (int r = y; r < y1; ++r) {
        Rgb* row = img.row(r);
        if (x >= bw && cw == bw) {
          std::copy(row + x - bw, row + x, row + x);
        } else {
          std::fill(row + x, row + x1, Rgb{});
        }
      }
      break;
    case Shift: {
      const int shift = rand_range(rng, floor_div(-bw, 2), bw / 2);
      if (shift != 0) {
        for (int r = y; r < y1; ++r) roll_pixels(img.row(r) + x, cw, shift);
      }
      break;
    }
    case Zero:
      for (int r = y; r < y1; ++r) std::fill(img.row(r) + x, img.row(r) + x1, Rgb{});
      break;
    case Noise:
      for (int r = y; r < y1; ++r) {
        Rgb* row = img.row(r);
        for (int c = x; c < x1; ++c) {
          row[c].r = static_cast<uint8_t>(byte(rng));
          row[c].g = static_cast<uint8_t>(byte(rng));
          row[c].b = static_cast<uint8_t>(byte(rng));
        }
      }
      break;
    }
  }

  // datamoshing: cyclic row displacement
  if (k > 0.5f && h >= 2) {
    const int lines = static_cast<int>(k * 20);
    for (int i = 0; i < lines; ++i) {
      const int y = rand_range(rng, 0, h - 1);
      const int band_h = rand_range(rng, 1, 5);
      const int shift = rand_range(rng, floor_div(-w, 4), w / 4);
      if (y + band_h >= h) continue;
      for (int r = y; r < y + band_h; ++r) roll_pixels(img.row(r), w, shift);
    }
  }
  return img;
}

PixelBuffer ArtifactSynthesizer::color_bleed(const PixelBuffer& src) const {
  const int w = src.width();
  const int h = src.height();
  const size_t n = src.size();

  std::vector<uint8_t> r(n), g(n), b(n);
  const Rgb* s = src.data();
  for (size_t i = 0; i < n; ++i) {
    r[i] = s[i].r;
    g[i] = s[i].g;
    b[i] = s[i].b;
  }

  const int shift = static_cast<int>(intensity_ * 5);
  roll_channel(r, w, h, shift);
  roll_channel(b, w, h, -shift);

  if (intensity_ > 0.1f) {
    const double radius = std::min(intensity_ * 3.0, 10.0);
    cv::Mat rm(h, w, CV_8UC1, r.data());
    cv::Mat gm(h, w, CV_8UC1, g.data());
    cv::Mat bm(h, w, CV_8UC1, b.data());
    // red and blue smear further than green
    cv::GaussianBlur(rm, rm, cv::Size(0, 0), radius, radius, cv::BORDER_REPLICATE);
    cv::GaussianBlur(bm, bm, cv::Size(0, 0), radius, radius, cv::BORDER_REPLICATE);
    cv::GaussianBlur(gm, gm, cv::Size(0, 0), radius * 0.5, radius * 0.5, cv::BORDER_REPLICATE);
  }

  PixelBuffer dst(w, h);
  Rgb* d = dst.data();
  for (size_t i = 0; i < n; ++i) {
    d[i] = Rgb{r[i], g[i], b[i]};
  }
  return dst;
}

} // namespace crtmix
