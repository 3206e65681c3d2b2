#pragma once
#include "../../include/crtmix.hpp"
#include "../../include/effect_config.hpp"
#include <vector>

namespace crtmix {

// Analog and digital degradation, intensity in [0,1]
class ArtifactSynthesizer {
public:
  ArtifactSynthesizer(ArtifactType type, float intensity);
  ~ArtifactSynthesizer() = default;

  PixelBuffer process(const PixelBuffer& src, Rng& rng) const;

  // JPEG quality used for a given intensity: 100 - intensity*90, in [1,100]
  static int jpeg_quality(float intensity);

private:
  PixelBuffer jpeg(const PixelBuffer& src) const;
  PixelBuffer vhs(const PixelBuffer& src, Rng& rng) const;
  PixelBuffer digital_glitch(const PixelBuffer& src, Rng& rng) const;
  PixelBuffer color_bleed(const PixelBuffer& src) const;

  ArtifactType type_;
  float intensity_;
};

// Cyclic shift of n pixels to the right by shift (negative: left)
void roll_pixels(Rgb* first, int n, int shift);

} // namespace crtmix
