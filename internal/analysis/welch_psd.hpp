#pragma once

#include <cstdint>
#include <vector>

namespace trackmatch::analysis {

// One-sided power spectral density, V**2/Hz.
struct PowerSpectrum {
  std::vector<double> frequencies;
  std::vector<double> power;
  uint32_t            segments{0};

  double BinWidthHz() const {
    return frequencies.size() > 1 ? frequencies[1] - frequencies[0] : 0.0;
  }
};

/*
  Welch's averaged periodogram.

  Periodic Hann window, per-segment mean removal, density scaling.
  Segments shorter than the configured length are used as-is when the
  input itself is shorter.
*/
class WelchPsd {
 public:
  WelchPsd(uint32_t segment_length, double overlap);

  PowerSpectrum Compute(const std::vector<float>& samples, uint32_t sample_rate) const;

 private:
  uint32_t segment_length_;
  double   overlap_;
};

} // namespace trackmatch::analysis
