#include "include/effect_config.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace crtmix;

static bool rejects(const EffectConfig& cfg, const std::string& field) {
  try {
    cfg.validate();
  } catch (const Error& e) {
    return e.kind() == ErrorKind::UnsupportedParameter &&
           std::string(e.what()).find(field) != std::string::npos;
  }
  return false;
}

int main() {
  EffectConfig defaults;
  defaults.validate();
  assert(defaults.sort.threshold == 100);
  assert(defaults.sort.preview_max_dimension == 800);
  assert(!defaults.crt.enabled && !defaults.noise.enabled && !defaults.artifact.enabled);

  assert(parse_sort_key("hue") == SortKey::Hue);
  assert(parse_sort_direction("vertical") == SortDirection::Vertical);
  assert(parse_swap_mode("gbr") == ChannelSwapMode::GBR);
  assert(parse_noise_type("salt_pepper") == NoiseType::SaltPepper);
  assert(parse_artifact_type("digital_glitch") == ArtifactType::DigitalGlitch);
  assert(std::string(to_string(ArtifactType::ColorBleed)) == "color_bleed");
  assert(std::string(to_string(ErrorKind::EncodeFailure)) == "encode_failure");

  bool caught = false;
  try {
    parse_swap_mode("rrb");
  } catch (const Error& e) {
    caught = e.kind() == ErrorKind::UnsupportedParameter;
  }
  assert(caught);

  EffectConfig c = defaults;
  c.sort.threshold = 256;
  assert(rejects(c, "sort.threshold"));

  c = defaults;
  c.crt.scanline_thickness = 0;
  assert(rejects(c, "crt.scanline_thickness"));

  c = defaults;
  c.crt.glow = -0.1f;
  assert(rejects(c, "crt.glow"));

  c = defaults;
  c.noise.intensity = 2.0f;
  assert(rejects(c, "noise.intensity"));

  c = defaults;
  c.artifact.intensity = -1.0f;
  assert(rejects(c, "artifact.intensity"));

  c = defaults;
  c.sort.workers = kMaxWorkers;
  c.validate();
  c.sort.workers = kMaxWorkers + 1;
  assert(rejects(c, "sort.workers"));

  c = defaults;
  c.channel.aberration = -3;
  assert(rejects(c, "channel.aberration"));

  // PixelBuffer construction guards
  caught = false;
  try {
    PixelBuffer b(-1, 4);
  } catch (const Error& e) {
    caught = e.kind() == ErrorKind::UnsupportedParameter;
  }
  assert(caught);

  caught = false;
  try {
    PixelBuffer b(2, 2, std::vector<Rgb>(3));
  } catch (const Error& e) {
    caught = e.kind() == ErrorKind::InvalidImage;
  }
  assert(caught);

  PixelBuffer t(3, 2, {Rgb{1, 0, 0}, Rgb{2, 0, 0}, Rgb{3, 0, 0}, Rgb{4, 0, 0}, Rgb{5, 0, 0}, Rgb{6, 0, 0}});
  PixelBuffer tt = transpose(t);
  assert(tt.width() == 2 && tt.height() == 3);
  assert(tt.at(1, 0).r == 4 && tt.at(0, 2).r == 3);
  assert(transpose(tt) == t);

  Rng a = make_rng(true, 99), b = make_rng(true, 99);
  assert(a() == b());

  std::cout << "EffectConfig test PASSED\n";
  return 0;
}
