#pragma once
#include "../../include/crtmix.hpp"
#include "../../include/effect_config.hpp"

namespace crtmix {

// Stochastic noise overlay, intensity in [0,1]:
//   gaussian     per-channel N(0, intensity*255)
//   salt_pepper  white with p=intensity/2, then black with p=intensity/2
//   film_grain   one N(0, intensity*128) sample shared by all channels
class NoiseSynthesizer {
public:
  NoiseSynthesizer(NoiseType type, float intensity);
  ~NoiseSynthesizer() = default;

  PixelBuffer process(const PixelBuffer& src, Rng& rng) const;

private:
  PixelBuffer gaussian(const PixelBuffer& src, Rng& rng) const;
  PixelBuffer salt_pepper(const PixelBuffer& src, Rng& rng) const;
  PixelBuffer film_grain(const PixelBuffer& src, Rng& rng) const;

  NoiseType type_;
  float intensity_;
};

} // namespace crtmix
