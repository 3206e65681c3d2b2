#pragma once
#include "../../include/crtmix.hpp"
#include "../../include/effect_config.hpp"
#include <opencv2/core.hpp>

namespace crtmix {

struct CrtParams {
  float scanline_intensity = 0.15f;
  int scanline_thickness = 1;
  int scanline_count = 600;     // <= 0 falls back to height/600 spacing
  float warp_x = 0.02f;
  float warp_y = 0.02f;
  float mask_dark = 0.9f;
  float mask_light = 1.05f;
  float brightness = 1.2f;
  float glow = 0.0f;

  static CrtParams from_config(const CrtConfig& cfg);
};

// CRT display emulation on a [0,1]-normalized float copy of the image:
// barrel warp -> scanlines -> shadow mask -> phosphor glow -> brightness,
// then truncating re-quantization to 8 bits.
class CrtSimulator {
public:
  explicit CrtSimulator(const CrtParams& params);
  ~CrtSimulator() = default;

  PixelBuffer process(const PixelBuffer& src) const;

  // Stages operate on CV_32FC3 images in R,G,B channel order.
  static cv::Mat normalize(const PixelBuffer& src);
  static PixelBuffer quantize(const cv::Mat& img, float brightness);

  // Inverse-mapped radial distortion with bilinear sampling. Destination
  // pixels with f <= 0 or an out-of-bounds source stay black.
  static cv::Mat barrel_warp(const cv::Mat& src, float warp_x, float warp_y, bool edge_fade = true);
  // Darken `thickness` rows at every `spacing`-th row
  static void scanlines(cv::Mat& img, float intensity, int thickness, int spacing);
  // RGB phosphor stripes; one triad spans `spacing` columns (spacing >= 3)
  static void shadow_mask(cv::Mat& img, float mask_dark, float mask_light, int spacing);
  // orig*(1-glow) + gaussian(orig, sigma=2)*glow, clamped to [0,1]
  static cv::Mat phosphor_glow(const cv::Mat& img, float glow);

  static int scanline_spacing(int height, int count);
  static int mask_spacing(int width);

private:
  CrtParams params_;
};

} // namespace crtmix
