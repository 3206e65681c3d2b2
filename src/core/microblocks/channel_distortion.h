#pragma once
#include "../../include/crtmix.hpp"
#include "../../include/effect_config.hpp"
#include <array>

namespace crtmix {

// Per-pixel channel permutation; out[c] = in[order[c]]
class ChannelSwap {
public:
  explicit ChannelSwap(ChannelSwapMode mode);
  ~ChannelSwap() = default;
  PixelBuffer process(const PixelBuffer& src) const;

  static std::array<int, 3> order(ChannelSwapMode mode);

private:
  std::array<int, 3> order_;
};

// Each output channel samples the input at (x - dx, y - dy) of its own
// offset. Out-of-bounds samples leave the channel at 0.
class ChannelShift {
public:
  ChannelShift(ChannelOffset red, ChannelOffset green, ChannelOffset blue);
  ~ChannelShift() = default;
  PixelBuffer process(const PixelBuffer& src) const;

  bool identity() const { return red_.zero() && green_.zero() && blue_.zero(); }

private:
  ChannelOffset red_;
  ChannelOffset green_;
  ChannelOffset blue_;
};

// Radial channel shift: red sampled outward, blue inward, by strength
// scaled with the normalized center-relative position. Green is unshifted.
class ChromaticAberration {
public:
  explicit ChromaticAberration(int strength);
  ~ChromaticAberration() = default;
  PixelBuffer process(const PixelBuffer& src) const;

private:
  int strength_;
};

// Independent per-channel gain in [0,2], truncated back to 8 bits
class ChannelScale {
public:
  ChannelScale(float red, float green, float blue);
  ~ChannelScale() = default;
  PixelBuffer process(const PixelBuffer& src) const;

private:
  float red_;
  float green_;
  float blue_;
};

} // namespace crtmix
