#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace trackmatch::analysis {

struct DecodedAudio {
  std::vector<float> samples;
  uint32_t           sample_rate{0};
  uint32_t           bit_depth{0};
  uint32_t           channels{0};
};

/*
  Reads an analysis window from an audio file via libsndfile.

  The window starts one third into the file (past intros and silence) and
  spans at most `window_seconds`; channels are averaged to mono. Any
  unreadable or corrupt input raises util::DecodeError.
*/
class AudioDecoder {
 public:
  explicit AudioDecoder(double window_seconds);

  DecodedAudio Decode(const std::string& path) const;

 private:
  double window_seconds_;
};

} // namespace trackmatch::analysis
