#include "audio_decoder.hpp"

#include <sndfile.hh>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace trackmatch::analysis {

namespace {

uint32_t BitDepthOf(int format) {
  switch (format & SF_FORMAT_SUBMASK) {
    case SF_FORMAT_PCM_S8:
    case SF_FORMAT_PCM_U8:
      return 8;
    case SF_FORMAT_PCM_16:
      return 16;
    case SF_FORMAT_PCM_24:
      return 24;
    case SF_FORMAT_PCM_32:
    case SF_FORMAT_FLOAT:
      return 32;
    case SF_FORMAT_DOUBLE:
      return 64;
    default:
      return 0;
  }
}

} // namespace

AudioDecoder::AudioDecoder(double window_seconds) : window_seconds_(window_seconds) {
}

DecodedAudio AudioDecoder::Decode(const std::string& path) const {
  SndfileHandle file(path);
  if (file.rawHandle() == nullptr || file.error() != SF_ERR_NO_ERROR) {
    throw util::DecodeError("decode " + path + ": " + file.strError());
  }
  if (file.samplerate() <= 0 || file.channels() <= 0 || file.frames() <= 0) {
    throw util::DecodeError("decode " + path + ": empty or malformed stream");
  }

  const sf_count_t total    = file.frames();
  const sf_count_t start    = total / 3;
  const sf_count_t window   = static_cast<sf_count_t>(file.samplerate() * window_seconds_);
  const sf_count_t to_read  = std::min(window, total - start);
  const int        channels = file.channels();

  if (file.seek(start, SEEK_SET) < 0) {
    throw util::DecodeError("decode " + path + ": seek failed: " + file.strError());
  }

  std::vector<float> interleaved(static_cast<size_t>(to_read) * channels);
  const sf_count_t   read = file.readf(interleaved.data(), to_read);
  if (read <= 0) {
    throw util::DecodeError("decode " + path + ": no frames readable: " + file.strError());
  }

  DecodedAudio audio;
  audio.sample_rate = static_cast<uint32_t>(file.samplerate());
  audio.bit_depth   = BitDepthOf(file.format());
  audio.channels    = static_cast<uint32_t>(channels);
  audio.samples.resize(static_cast<size_t>(read));
  for (sf_count_t frame = 0; frame < read; ++frame) {
    float sum = 0.0f;
    for (int c = 0; c < channels; ++c) sum += interleaved[static_cast<size_t>(frame) * channels + c];
    audio.samples[static_cast<size_t>(frame)] = sum / static_cast<float>(channels);
  }
  return audio;
}

} // namespace trackmatch::analysis
