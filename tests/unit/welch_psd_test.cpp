#include "internal/analysis/welch_psd.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <numbers>
#include <random>
#include <stdexcept>
#include <vector>

namespace {

using trackmatch::analysis::WelchPsd;

std::vector<float> Sine(double frequency, uint32_t sample_rate, size_t count) {
  std::vector<float> samples(count);
  for (size_t i = 0; i < count; ++i) {
    samples[i] = static_cast<float>(0.5 * std::sin(2.0 * std::numbers::pi * frequency * static_cast<double>(i) / sample_rate));
  }
  return samples;
}

void TestBinLayout() {
  WelchPsd psd(1024, 0.5);
  const auto spectrum = psd.Compute(std::vector<float>(16384, 0.1f), 44100);

  assert(spectrum.frequencies.size() == 513);
  assert(spectrum.power.size() == 513);
  assert(spectrum.frequencies.front() == 0.0);
  assert(std::fabs(spectrum.frequencies.back() - 22050.0) < 1e-9);
  assert(std::fabs(spectrum.BinWidthHz() - 44100.0 / 1024.0) < 1e-9);
  // (16384 - 1024) / 512 + 1
  assert(spectrum.segments == 31);
}

void TestSinePeaksAtItsBin() {
  constexpr uint32_t kRate = 44100;
  const double       bin_width = kRate / 1024.0;

  WelchPsd   psd(1024, 0.5);
  const auto spectrum = psd.Compute(Sine(100 * bin_width, kRate, 16384), kRate);

  const auto peak = std::max_element(spectrum.power.begin(), spectrum.power.end()) - spectrum.power.begin();
  assert(peak == 100);
  assert(spectrum.power[100] > 1e6 * spectrum.power[300]);
}

void TestNoisePowerMatchesVariance() {
  std::mt19937                          rng(7);
  std::uniform_real_distribution<float> dist(-0.5f, 0.5f);
  std::vector<float>                    samples(1 << 16);
  for (auto& s : samples) s = dist(rng);

  WelchPsd   psd(2048, 0.5);
  const auto spectrum = psd.Compute(samples, 48000);

  double integral = 0.0;
  for (double p : spectrum.power) integral += p * spectrum.BinWidthHz();

  const double variance = 1.0 / 12.0;
  assert(std::fabs(integral - variance) < 0.1 * variance);
}

void TestShortInputUsesOneSegment() {
  WelchPsd   psd(8192, 0.5);
  const auto spectrum = psd.Compute(std::vector<float>(1000, 0.0f), 8000);

  assert(spectrum.segments == 1);
  assert(spectrum.frequencies.size() == 501);
}

void TestRejectsBadParameters() {
  bool threw = false;
  try {
    WelchPsd psd(1024, 1.0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    WelchPsd psd(1024, 0.5);
    (void)psd.Compute({0.1f}, 44100);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBinLayout();
  TestSinePeaksAtItsBin();
  TestNoisePowerMatchesVariance();
  TestShortInputUsesOneSegment();
  TestRejectsBadParameters();
  std::cout << "trackmatch_unit_welch_psd: pass\n";
  return 0;
}
