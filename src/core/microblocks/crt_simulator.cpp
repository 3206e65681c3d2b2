#include "crt_simulator.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <string>

namespace crtmix {

namespace {

constexpr float kEdgeFadeMargin = 5.0f;
constexpr float kGlowSigma = 2.0f;
constexpr float kReferenceSize = 800.0f;
constexpr float kMinWarp = 0.001f;

void require(bool ok, const std::string& what) {
  if (!ok) throw Error(ErrorKind::UnsupportedParameter, what);
}

} // namespace

CrtParams CrtParams::from_config(const CrtConfig& cfg) {
  CrtParams p;
  p.scanline_intensity = cfg.scanline_intensity;
  p.scanline_thickness = cfg.scanline_thickness;
  p.scanline_count = cfg.scanline_count;
  p.warp_x = cfg.warp;
  p.warp_y = cfg.warp;
  p.mask_dark = cfg.mask_dark;
  p.mask_light = cfg.mask_light;
  p.brightness = cfg.brightness;
  p.glow = cfg.glow;
  return p;
}

CrtSimulator::CrtSimulator(const CrtParams& params) : params_(params) {
  require(params.scanline_intensity >= 0.0f && params.scanline_intensity <= 1.0f,
          "scanline intensity outside [0, 1]");
  require(params.scanline_thickness >= 1, "scanline thickness must be at least 1");
  require(params.warp_x >= 0.0f && params.warp_y >= 0.0f, "warp must not be negative");
  require(params.mask_dark >= 0.0f && params.mask_light >= 0.0f, "mask multipliers must not be negative");
  require(params.brightness >= 0.0f, "brightness must not be negative");
  require(params.glow >= 0.0f && params.glow <= 1.0f, "glow outside [0, 1]");
}

int CrtSimulator::scanline_spacing(int height, int count) {
  if (count > 0) return std::max(1, height / count);
  return std::max(2, height / 600);
}

int CrtSimulator::mask_spacing(int width) {
  return std::max(3, width / static_cast<int>(kReferenceSize));
}

PixelBuffer CrtSimulator::process(const PixelBuffer& src) const {
  if (src.empty()) return src;

  cv::Mat img = normalize(src);
  const int w = src.width();
  const int h = src.height();

  // warp strength is resolution independent
  const float scale = std::min(w, h) / kReferenceSize;
  const float wx = params_.warp_x / scale;
  const float wy = params_.warp_y / scale;
  if (wx > kMinWarp || wy > kMinWarp) {
    img = barrel_warp(img, wx, wy);
  }

  scanlines(img, params_.scanline_intensity, params_.scanline_thickness,
            scanline_spacing(h, params_.scanline_count));
  shadow_mask(img, params_.mask_dark, params_.mask_light, mask_spacing(w));
  if (params_.glow > 0.0f) {
    img = phosphor_glow(img, params_.glow);
  }
  return quantize(img, params_.brightness);
}

cv::Mat CrtSimulator::normalize(const PixelBuffer& src) {
  cv::Mat img(src.height(), src.width(), CV_32FC3);
  for (int y = 0; y < src.height(); ++y) {
    const Rgb* s = src.row(y);
    cv::Vec3f* d = img.ptr<cv::Vec3f>(y);
    for (int x = 0; x < src.width(); ++x) {
      d[x] = cv::Vec3f(s[x].r / 255.0f, s[x].g / 255.0f, s[x].b / 255.0f);
    }
  }
  return img;
}

PixelBuffer CrtSimulator::quantize(const cv::Mat& img, float brightness) {
  CV_Assert(img.type() == CV_32FC3);
  PixelBuffer out(img.cols, img.rows);
  for (int y = 0; y < img.rows; ++y) {
    const cv::Vec3f* s = img.ptr<cv::Vec3f>(y);
    Rgb* d = out.row(y);
    for (int x = 0; x < img.cols; ++x) {
      d[x].r = clamp_u8(s[x][0] * brightness * 255.0f);
      d[x].g = clamp_u8(s[x][1] * brightness * 255.0f);
      d[x].b = clamp_u8(s[x][2] * brightness * 255.0f);
    }
  }
  return out;
}

cv::Mat CrtSimulator::barrel_warp(const cv::Mat& src, float warp_x, float warp_y, bool edge_fade) {
  CV_Assert(src.type() == CV_32FC3);
  const int w = src.cols;
  const int h = src.rows;
  cv::Mat dst = cv::Mat::zeros(h, w, CV_32FC3);
  const float cx = w / 2.0f;
  const float cy = h / 2.0f;
  const float k = warp_x + warp_y;

  cv::parallel_for_(cv::Range(0, h), [&](const cv::Range& range) {
    for (int y = range.start; y < range.end; ++y) {
      cv::Vec3f* d = dst.ptr<cv::Vec3f>(y);
      const float ny = (y - cy) / cy;
      for (int x = 0; x < w; ++x) {
        const float nx = (x - cx) / cx;
        const float f = 1.0f - (nx * nx + ny * ny) * k;
        if (f <= 0.0f) continue;

        const float sx = cx + nx * cx / f;
        const float sy = cy + ny * cy / f;
        if (!(sx >= 0.0f && sx < w - 1 && sy >= 0.0f && sy < h - 1)) continue;

        const int x0 = static_cast<int>(sx);
        const int y0 = static_cast<int>(sy);
        const float fx = sx - x0;
        const float fy = sy - y0;
        const cv::Vec3f* r0 = src.ptr<cv::Vec3f>(y0);
        const cv::Vec3f* r1 = src.ptr<cv::Vec3f>(y0 + 1);
        cv::Vec3f v = r0[x0] * ((1 - fx) * (1 - fy)) + r0[x0 + 1] * (fx * (1 - fy)) +
                      r1[x0] * ((1 - fx) * fy) + r1[x0 + 1] * (fx * fy);

        if (edge_fade) {
          const float edge = std::min(std::min(sx, w - 1 - sx), std::min(sy, h - 1 - sy));
          if (edge < kEdgeFadeMargin) v *= edge / kEdgeFadeMargin;
        }
        d[x] = v;
      }
    }
  });
  return dst;
}

void CrtSimulator::scanlines(cv::Mat& img, float intensity, int thickness, int spacing) {
  CV_Assert(img.type() == CV_32FC3);
  require(spacing >= 1, "scanline spacing must be at least 1");
  const float keep = 1.0f - intensity;
  for (int y = 0; y < img.rows; y += spacing) {
    for (int t = 0; t < thickness && y + t < img.rows; ++t) {
      cv::Vec3f* row = img.ptr<cv::Vec3f>(y + t);
      for (int x = 0; x < img.cols; ++x) row[x] *= keep;
    }
  }
}

void CrtSimulator::shadow_mask(cv::Mat& img, float mask_dark, float mask_light, int spacing) {
  CV_Assert(img.type() == CV_32FC3);
  require(spacing >= 3, "shadow mask spacing must be at least 3");
  for (int y = 0; y < img.rows; ++y) {
    cv::Vec3f* row = img.ptr<cv::Vec3f>(y);
    for (int x = 0; x < img.cols; ++x) {
      const int lit = (x % spacing) * 3 / spacing; // 0=R 1=G 2=B
      for (int c = 0; c < 3; ++c) {
        row[x][c] = c == lit ? std::min(row[x][c] * mask_light, 1.0f) : row[x][c] * mask_dark;
      }
    }
  }
}

cv::Mat CrtSimulator::phosphor_glow(const cv::Mat& img, float glow) {
  CV_Assert(img.type() == CV_32FC3);
  if (glow <= 0.0f) return img;
  cv::Mat blurred;
  cv::GaussianBlur(img, blurred, cv::Size(0, 0), kGlowSigma, kGlowSigma, cv::BORDER_REFLECT);
  cv::Mat out;
  cv::addWeighted(img, 1.0 - glow, blurred, glow, 0.0, out);
  cv::min(out, 1.0, out);
  cv::max(out, 0.0, out);
  return out;
}

} // namespace crtmix
