#include "welch_psd.hpp"

#include <fftw3.h>

#include <cmath>
#include <algorithm>
#include <mutex>
#include <numbers>
#include <stdexcept>

namespace trackmatch::analysis {

namespace {

// fftw planner calls are not thread-safe; execution on distinct plans is.
std::mutex& PlannerMutex() {
  static std::mutex mutex;
  return mutex;
}

/*
  Owns an r2c plan plus its aligned buffers.
*/
class FftPlan {
 public:
  explicit FftPlan(int size) : size_(size) {
    std::lock_guard lock(PlannerMutex());
    input_  = fftwf_alloc_real(size_);
    output_ = fftwf_alloc_complex(size_ / 2 + 1);
    if (!input_ || !output_) {
      Release();
      throw std::runtime_error("fftw: buffer allocation failed");
    }
    // FFTW_ESTIMATE keeps plans (and therefore results) reproducible.
    plan_ = fftwf_plan_dft_r2c_1d(size_, input_, output_, FFTW_ESTIMATE);
    if (!plan_) {
      Release();
      throw std::runtime_error("fftw: plan creation failed");
    }
  }

  ~FftPlan() {
    std::lock_guard lock(PlannerMutex());
    Release();
  }

  FftPlan(const FftPlan&)            = delete;
  FftPlan& operator=(const FftPlan&) = delete;

  float* Input() {
    return input_;
  }

  double PowerAt(int bin) const {
    return static_cast<double>(output_[bin][0]) * output_[bin][0] + static_cast<double>(output_[bin][1]) * output_[bin][1];
  }

  void Execute() {
    fftwf_execute(plan_);
  }

 private:
  void Release() {
    if (plan_) fftwf_destroy_plan(plan_);
    if (input_) fftwf_free(input_);
    if (output_) fftwf_free(output_);
    plan_   = nullptr;
    input_  = nullptr;
    output_ = nullptr;
  }

  int            size_;
  float*         input_{nullptr};
  fftwf_complex* output_{nullptr};
  fftwf_plan     plan_{nullptr};
};

} // namespace

WelchPsd::WelchPsd(uint32_t segment_length, double overlap) : segment_length_(segment_length), overlap_(overlap) {
  if (segment_length_ < 2) {
    throw std::invalid_argument("welch: segment length must be at least 2");
  }
  if (overlap_ < 0.0 || overlap_ >= 1.0) {
    throw std::invalid_argument("welch: overlap must be in [0, 1)");
  }
}

PowerSpectrum WelchPsd::Compute(const std::vector<float>& samples, uint32_t sample_rate) const {
  if (samples.size() < 2 || sample_rate == 0) {
    throw std::invalid_argument("welch: need at least two samples and a sample rate");
  }

  const size_t nperseg  = std::min<size_t>(segment_length_, samples.size());
  const size_t noverlap = static_cast<size_t>(std::floor(static_cast<double>(nperseg) * overlap_));
  const size_t step     = std::max<size_t>(1, nperseg - noverlap);
  const size_t segments = 1 + (samples.size() - nperseg) / step;
  const size_t bins     = nperseg / 2 + 1;

  std::vector<double> window(nperseg);
  double              window_power = 0.0;
  for (size_t i = 0; i < nperseg; ++i) {
    window[i] = 0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(nperseg));
    window_power += window[i] * window[i];
  }

  FftPlan             plan(static_cast<int>(nperseg));
  std::vector<double> accumulated(bins, 0.0);

  for (size_t s = 0; s < segments; ++s) {
    const float* segment = samples.data() + s * step;

    double mean = 0.0;
    for (size_t i = 0; i < nperseg; ++i) mean += segment[i];
    mean /= static_cast<double>(nperseg);

    float* input = plan.Input();
    for (size_t i = 0; i < nperseg; ++i) {
      input[i] = static_cast<float>((segment[i] - mean) * window[i]);
    }
    plan.Execute();

    for (size_t k = 0; k < bins; ++k) {
      accumulated[k] += plan.PowerAt(static_cast<int>(k));
    }
  }

  const double scale = 1.0 / (static_cast<double>(sample_rate) * window_power * static_cast<double>(segments));

  PowerSpectrum spectrum;
  spectrum.segments = static_cast<uint32_t>(segments);
  spectrum.frequencies.resize(bins);
  spectrum.power.resize(bins);
  for (size_t k = 0; k < bins; ++k) {
    spectrum.frequencies[k] = static_cast<double>(k) * sample_rate / static_cast<double>(nperseg);
    double p                = accumulated[k] * scale;
    // one-sided: fold negative frequencies, except DC and (even length) Nyquist
    const bool is_nyquist = (nperseg % 2 == 0) && k == bins - 1;
    if (k != 0 && !is_nyquist) p *= 2.0;
    spectrum.power[k] = p;
  }
  return spectrum;
}

} // namespace trackmatch::analysis
