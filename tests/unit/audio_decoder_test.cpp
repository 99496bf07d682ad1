#include "internal/analysis/audio_decoder.hpp"

#include <sndfile.hh>

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <vector>

#include "internal/analysis/authenticity_analyzer.hpp"
#include "internal/util/errors.hpp"
#include "test_fixtures.hpp"

namespace {

using trackmatch::analysis::AudioDecoder;
using trackmatch::analysis::AuthenticityAnalyzer;
using namespace trackmatch::core::v1;

std::filesystem::path TempPath(const std::string& name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "trackmatch_audio_decoder_tests";
  std::filesystem::create_directories(base_dir);
  return base_dir / name;
}

std::filesystem::path WriteWav(const std::string& name, const std::vector<float>& interleaved, int channels, int sample_rate) {
  const auto    path = TempPath(name);
  SndfileHandle out(path.string(), SFM_WRITE, SF_FORMAT_WAV | SF_FORMAT_PCM_16, channels, sample_rate);
  assert(out.error() == SF_ERR_NO_ERROR);
  const sf_count_t frames = static_cast<sf_count_t>(interleaved.size() / channels);
  const sf_count_t written = out.writef(interleaved.data(), frames);
  assert(written == frames);
  return path;
}

void TestStereoIsMixedToMonoWindow() {
  std::vector<float> interleaved;
  for (int i = 0; i < 44100 * 3; ++i) {
    interleaved.push_back(0.5f);
    interleaved.push_back(0.25f);
  }
  const auto path = WriteWav("stereo.wav", interleaved, 2, 44100);

  AudioDecoder decoder(1.0);
  const auto   audio = decoder.Decode(path.string());

  assert(audio.sample_rate == 44100);
  assert(audio.bit_depth == 16);
  assert(audio.channels == 2);
  assert(audio.samples.size() == 44100);
  assert(std::fabs(audio.samples[0] - 0.375f) < 1e-3f);
}

void TestWindowClampedToFileEnd() {
  const auto path = WriteWav("short.wav", std::vector<float>(3000, 0.1f), 1, 8000);

  AudioDecoder decoder(30.0);
  const auto   audio = decoder.Decode(path.string());

  // starts a third of the way in
  assert(audio.samples.size() == 2000);
}

void TestCorruptFileRaisesDecodeError() {
  const auto path = TempPath("corrupt.flac");
  std::ofstream(path) << "this is not audio";

  AudioDecoder decoder(1.0);
  bool         threw = false;
  try {
    (void)decoder.Decode(path.string());
  } catch (const trackmatch::util::DecodeError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)decoder.Decode(TempPath("missing.wav").string());
  } catch (const trackmatch::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestAnalyzeFile() {
  std::mt19937                          rng(5);
  std::uniform_real_distribution<float> dist(-0.5f, 0.5f);
  std::vector<float>                    noise(44100 * 3);
  for (auto& s : noise) s = dist(rng);
  const auto noise_path = WriteWav("noise.wav", noise, 1, 44100);

  const auto corrupt_path = TempPath("corrupt_analyze.wav");
  std::ofstream(corrupt_path) << "RIFF garbage";

  auto config = trackmatch::testing::TestConfig().analysis();
  config.set_sample_seconds(1.5);
  AuthenticityAnalyzer analyzer(config);

  const auto good = analyzer.AnalyzeFile(noise_path.string());
  assert(good.verdict() == VERDICT_AUTHENTIC);
  assert(good.sample_rate() == 44100);
  assert(good.bit_depth() == 16);

  const auto bad = analyzer.AnalyzeFile(corrupt_path.string());
  assert(bad.verdict() == VERDICT_UNDETERMINED);
  assert(bad.rationale().rfind("decode failed", 0) == 0);
}

} // namespace

int main() {
  TestStereoIsMixedToMonoWindow();
  TestWindowClampedToFileEnd();
  TestCorruptFileRaisesDecodeError();
  TestAnalyzeFile();
  std::cout << "trackmatch_unit_audio_decoder: pass\n";
  return 0;
}
