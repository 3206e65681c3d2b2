#pragma once
#include "../../include/crtmix.hpp"

namespace crtmix {

// Analog broadcast faults. Standalone transforms outside the fixed effect
// pipeline order.
class SignalDistortion {
public:
  // Each row, with the given probability, rolls by a random amount in
  // [-max_shift, max_shift].
  static PixelBuffer scanline_shift(const PixelBuffer& src, int max_shift, double probability, Rng& rng);

  // Additive per-channel N(0, amount*255)
  static PixelBuffer signal_noise(const PixelBuffer& src, double amount, Rng& rng);

  // Even rows scaled by 1 - strength*0.3
  static PixelBuffer interlacing(const PixelBuffer& src, double strength);

  // Cyclic vertical roll by shift rows
  static PixelBuffer vertical_hold(const PixelBuffer& src, int shift);

  // Red and blue replaced by the mean over 2*amount+1 horizontal neighbours
  static PixelBuffer chroma_smear(const PixelBuffer& src, int amount);

  // block_count rectangles of black or noise
  static PixelBuffer signal_dropout(const PixelBuffer& src, int block_count, int block_size, Rng& rng);
};

} // namespace crtmix
