#include "authenticity_analyzer.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trackmatch::analysis {

using namespace trackmatch::core::v1;
using trackmatch::observability::DoubleField;
using trackmatch::observability::IntField;
using trackmatch::observability::StringField;

namespace {

constexpr double kPowerFloor        = 1e-30;
constexpr double kTransitionNear    = 250.0;
constexpr double kTransitionFar     = 1000.0;
constexpr double kResidualOffsetHz  = 500.0;

std::string Khz(double hz) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << hz / 1000.0 << "kHz";
  return out.str();
}

std::string Db(double db) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << db << "dB";
  return out.str();
}

// Mean of `levels` over bins whose frequency lies in [low, high].
std::optional<double> BandMean(const PowerSpectrum& spectrum, const std::vector<double>& levels, double low, double high) {
  double sum   = 0.0;
  size_t count = 0;
  for (size_t i = 0; i < spectrum.frequencies.size(); ++i) {
    const double f = spectrum.frequencies[i];
    if (f >= low && f <= high) {
      sum += levels[i];
      ++count;
    }
  }
  if (count == 0) return std::nullopt;
  return sum / static_cast<double>(count);
}

double Rms(const std::vector<float>& samples) {
  double sum = 0.0;
  for (float s : samples) sum += static_cast<double>(s) * s;
  return std::sqrt(sum / static_cast<double>(samples.size()));
}

} // namespace

std::string_view ToString(Verdict verdict) {
  switch (verdict) {
    case VERDICT_AUTHENTIC:
      return "AUTHENTIC";
    case VERDICT_WARNING:
      return "WARNING";
    case VERDICT_SUSPICIOUS:
      return "SUSPICIOUS";
    case VERDICT_FAKE:
      return "FAKE";
    case VERDICT_UNDETERMINED:
      return "UNDETERMINED";
    default:
      return "UNSPECIFIED";
  }
}

std::string DisplayLine(const AuthenticityVerdict& verdict) {
  switch (verdict.verdict()) {
    case VERDICT_AUTHENTIC:
      return "Lossless OK (spectrum to " + Khz(verdict.cutoff_hz()) + ")";
    case VERDICT_WARNING:
      return "Possible transcode (cutoff " + Khz(verdict.cutoff_hz()) + ")";
    case VERDICT_SUSPICIOUS:
      return "Likely transcode (cutoff " + Khz(verdict.cutoff_hz()) + ")";
    case VERDICT_FAKE:
      return "Fake lossless (cutoff " + Khz(verdict.cutoff_hz()) + ")";
    default:
      return "Undetermined (" + verdict.rationale() + ")";
  }
}

AuthenticityAnalyzer::AuthenticityAnalyzer(trackmatch::runtime::config::AnalysisConfig config)
    : config_(std::move(config)), psd_(config_.segment_length(), config_.overlap()), decoder_(config_.sample_seconds()) {
}

AuthenticityVerdict AuthenticityAnalyzer::Undetermined(std::string rationale, uint32_t sample_rate, uint32_t bit_depth) {
  AuthenticityVerdict verdict;
  verdict.set_verdict(VERDICT_UNDETERMINED);
  verdict.set_sample_rate(sample_rate);
  verdict.set_bit_depth(bit_depth);
  verdict.set_nyquist_hz(sample_rate / 2.0);
  verdict.set_rationale(std::move(rationale));
  verdict.set_display(DisplayLine(verdict));
  return verdict;
}

AuthenticityVerdict AuthenticityAnalyzer::Analyze(const std::vector<float>& samples, uint32_t sample_rate, uint32_t bit_depth) const {
  try {
    return Classify(samples, sample_rate, bit_depth);
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_WARN("Spectral analysis failed", {StringField("error", e.what()), IntField("samples", static_cast<std::int64_t>(samples.size()))});
    return Undetermined(std::string("analysis failed: ") + e.what(), sample_rate, bit_depth);
  }
}

AuthenticityVerdict AuthenticityAnalyzer::Classify(const std::vector<float>& samples, uint32_t sample_rate, uint32_t bit_depth) const {
  if (sample_rate == 0) {
    return Undetermined("unknown sample rate", sample_rate, bit_depth);
  }
  const double nyquist = sample_rate / 2.0;
  if (nyquist <= config_.reference_band_high_hz()) {
    return Undetermined("sample rate too low for spectral analysis", sample_rate, bit_depth);
  }
  if (samples.size() < config_.min_samples()) {
    return Undetermined("too few samples (" + std::to_string(samples.size()) + ")", sample_rate, bit_depth);
  }
  if (Rms(samples) < config_.silence_rms()) {
    return Undetermined("near-silent input", sample_rate, bit_depth);
  }

  const auto spectrum = psd_.Compute(samples, sample_rate);

  std::vector<double> levels(spectrum.power.size());
  for (size_t i = 0; i < levels.size(); ++i) {
    levels[i] = 10.0 * std::log10(spectrum.power[i] + kPowerFloor);
  }

  const auto reference = BandMean(spectrum, levels, config_.reference_band_low_hz(), config_.reference_band_high_hz());
  if (!reference) {
    return Undetermined("reference band has no bins", sample_rate, bit_depth);
  }
  for (auto& level : levels) level -= *reference;

  // Highest sustained run above threshold, scanning down from Nyquist.
  const double          threshold = -config_.threshold_db();
  const uint32_t        min_run   = config_.min_run_bins();
  uint32_t              run       = 0;
  std::optional<size_t> cutoff_bin;
  for (size_t i = levels.size(); i-- > 0;) {
    if (levels[i] >= threshold) {
      if (++run >= min_run) {
        cutoff_bin = i + min_run - 1;
        break;
      }
    } else {
      run = 0;
    }
  }
  if (!cutoff_bin) {
    return Undetermined("no sustained energy above the noise floor", sample_rate, bit_depth);
  }

  const double cutoff     = spectrum.frequencies[*cutoff_bin];
  const auto   below      = BandMean(spectrum, levels, cutoff - kTransitionFar, cutoff - kTransitionNear);
  const auto   above      = BandMean(spectrum, levels, cutoff + kTransitionNear, cutoff + kTransitionFar);
  const auto   residual   = BandMean(spectrum, levels, cutoff + kResidualOffsetHz, nyquist);
  const double transition = (below && above) ? *below - *above : 0.0;

  AuthenticityVerdict verdict;
  verdict.set_cutoff_hz(std::round(cutoff));
  verdict.set_nyquist_hz(nyquist);
  verdict.set_sample_rate(sample_rate);
  verdict.set_bit_depth(bit_depth);
  verdict.set_transition_db(std::round(transition * 10.0) / 10.0);
  verdict.set_residual_db(residual ? std::round(*residual * 10.0) / 10.0 : 0.0);

  const bool in_lossy_band = cutoff >= config_.lossy_band_low_hz() && cutoff <= config_.lossy_band_high_hz();

  if (cutoff >= config_.authentic_nyquist_ratio() * nyquist) {
    verdict.set_verdict(VERDICT_AUTHENTIC);
    verdict.set_rationale("energy extends to " + Khz(cutoff) + " of " + Khz(nyquist) + " Nyquist");
  } else if (in_lossy_band && transition >= config_.fake_transition_db() && residual && *residual <= config_.fake_residual_db()) {
    verdict.set_verdict(VERDICT_FAKE);
    verdict.set_rationale("brick-wall shelf at " + Khz(cutoff) + ", " + Db(transition) + " drop, " + Db(*residual) + " above cutoff");
  } else if (in_lossy_band && transition >= config_.sharp_transition_db()) {
    verdict.set_verdict(VERDICT_SUSPICIOUS);
    verdict.set_rationale("sharp shelf at " + Khz(cutoff) + " in the lossy encoder band, " + Db(transition) + " drop");
  } else {
    verdict.set_verdict(VERDICT_WARNING);
    verdict.set_rationale("gradual roll-off ending at " + Khz(cutoff) + ", " + Db(transition) + " transition");
  }
  verdict.set_display(DisplayLine(verdict));

  TRACKMATCH_LOG_DEBUG("Spectral verdict", {StringField("verdict", ToString(verdict.verdict())), DoubleField("cutoff_hz", cutoff),
                                            DoubleField("transition_db", transition), DoubleField("residual_db", verdict.residual_db())});
  return verdict;
}

AuthenticityVerdict AuthenticityAnalyzer::AnalyzeFile(const std::string& path) const {
  DecodedAudio audio;
  try {
    audio = decoder_.Decode(path);
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_WARN("Audio decode failed", {StringField("path", path), StringField("error", e.what())});
    return Undetermined(std::string("decode failed: ") + e.what());
  }
  return Analyze(audio.samples, audio.sample_rate, audio.bit_depth);
}

} // namespace trackmatch::analysis
