#include "noise_synth.h"
#include <random>
#include <string>

namespace crtmix {

NoiseSynthesizer::NoiseSynthesizer(NoiseType type, float intensity)
  : type_(type), intensity_(intensity) {
  if (!(intensity >= 0.0f && intensity <= 1.0f)) {
    throw Error(ErrorKind::UnsupportedParameter,
                "noise intensity " + std::to_string(intensity) + " outside [0, 1]");
  }
}

PixelBuffer NoiseSynthesizer::process(const PixelBuffer& src, Rng& rng) const {
  switch (type_) {
  case NoiseType::Gaussian: return gaussian(src, rng);
  case NoiseType::SaltPepper: return salt_pepper(src, rng);
  case NoiseType::FilmGrain: return film_grain(src, rng);
  }
  return src;
}

PixelBuffer NoiseSynthesizer::gaussian(const PixelBuffer& src, Rng& rng) const {
  const double sigma = intensity_ * 255.0;
  if (sigma <= 0.0) return src;
  std::normal_distribution<double> noise(0.0, sigma);

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

PixelBuffer NoiseSynthesizer::salt_pepper(const PixelBuffer& src, Rng& rng) const {
  const double p = intensity_ / 2.0;
  std::uniform_real_distribution<double> u(0.0, 1.0);
  PixelBuffer dst = src;
  Rgb* d = dst.data();

  // both masks are drawn independently; pepper lands last and wins
  for (size_t i = 0; i < dst.size(); ++i) {
    if (u(rng) < p) d[i] = Rgb{255, 255, 255};
  }
  for (size_t i = 0; i < dst.size(); ++i) {
    if (u(rng) < p) d[i] = Rgb{0, 0, 0};
  }
  return dst;
}

PixelBuffer NoiseSynthesizer::film_grain(const PixelBuffer& src, Rng& rng) const {
  const double sigma = intensity_ * 128.0;
  if (sigma <= 0.0) return src;
  std::normal_distribution<double> grain(0.0, sigma);

  PixelBuffer dst(src.width(), src.height());
  const Rgb* s = src.data();
  Rgb* d = dst.data();
  for (size_t i = 0; i < src.size(); ++i) {
    const double g = grain(rng);
    d[i].r = clamp_u8(s[i].r + g);
    d[i].g = clamp_u8(s[i].g + g);
    d[i].b = clamp_u8(s[i].b + g);
  }
  return dst;
}

} // namespace crtmix
