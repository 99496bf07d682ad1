#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/analysis/audio_decoder.hpp"
#include "internal/analysis/welch_psd.hpp"
#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::analysis {

/*
  AuthenticityAnalyzer

  Decides whether nominally lossless audio was transcoded from a lossy
  source. Lossy encoders low-pass the signal; the decoded result keeps a
  brick-wall shelf well below Nyquist that survives re-encoding.

    1. Welch PSD, in dB relative to the mean level of the reference band.
    2. Cutoff = top of the highest run of `min_run_bins` bins that stay
       within `threshold_db` of the reference level, scanning down from
       Nyquist.
    3. Transition = level just below the cutoff minus level just above it;
       residual = mean level from cutoff+500 Hz to Nyquist.
    4. AUTHENTIC   cutoff >= authentic_nyquist_ratio * Nyquist
       FAKE        cutoff in the lossy band, transition >= fake_transition_db
                   and residual <= fake_residual_db
       SUSPICIOUS  cutoff in the lossy band, transition >= sharp_transition_db
       WARNING     anything else

  Identical input always yields an identical verdict.
*/
class AuthenticityAnalyzer {
 public:
  explicit AuthenticityAnalyzer(trackmatch::runtime::config::AnalysisConfig config);

  // Never throws; a failed analysis is UNDETERMINED.
  trackmatch::core::v1::AuthenticityVerdict Analyze(const std::vector<float>& samples, uint32_t sample_rate, uint32_t bit_depth = 0) const;

  // Decode + Analyze. Decode failures are UNDETERMINED too.
  trackmatch::core::v1::AuthenticityVerdict AnalyzeFile(const std::string& path) const;

  static trackmatch::core::v1::AuthenticityVerdict Undetermined(std::string rationale, uint32_t sample_rate = 0, uint32_t bit_depth = 0);

 private:
  trackmatch::core::v1::AuthenticityVerdict Classify(const std::vector<float>& samples, uint32_t sample_rate, uint32_t bit_depth) const;

  trackmatch::runtime::config::AnalysisConfig config_;
  WelchPsd                                    psd_;
  AudioDecoder                                decoder_;
};

std::string_view ToString(trackmatch::core::v1::Verdict verdict);

// One-line human-readable summary, e.g. "Likely transcode (cutoff 16.0kHz)".
std::string DisplayLine(const trackmatch::core::v1::AuthenticityVerdict& verdict);

} // namespace trackmatch::analysis
