#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace trackmatch::config {

using namespace trackmatch::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// Candidates further than this from the reference are never reported.
static constexpr double kMaxExclusionBoundSecs = 30;

static void SetDefaultDuration(google::protobuf::Duration* d, std::chrono::milliseconds value) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    *d = trackmatch::util::ToProto(value);
  }
}

static bool IsPowerOfTwo(uint32_t v) {
  return v != 0 && (v & (v - 1)) == 0;
}

static void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: " + message);
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  using std::chrono::milliseconds;
  using std::chrono::seconds;

  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* provider = config.mutable_provider();
  if (provider->base_url().empty()) provider->set_base_url("http://localhost:5030");
  SetDefaultDuration(provider->mutable_request_timeout(), seconds(10));
  SetDefaultDuration(provider->mutable_connect_timeout(), seconds(3));

  auto* search = config.mutable_search();
  SetDefaultDuration(search->mutable_overall_timeout(), seconds(90));
  SetDefaultDuration(search->mutable_poll_interval(), seconds(2));
  SetDefaultDuration(search->mutable_stable_after(), seconds(8));
  SetDefaultDuration(search->mutable_min_tier_timeout(), seconds(10));
  if (search->max_results() == 0) search->set_max_results(10);

  auto* filter = config.mutable_filter();
  if (filter->preferred_extension().empty()) filter->set_preferred_extension("flac");
  if (filter->fallback_extensions_size() == 0) {
    for (const char* ext : {"alac", "wav", "aiff", "mp3", "aac", "m4a", "ogg", "opus", "wma"}) {
      filter->add_fallback_extensions(ext);
    }
  }
  if (filter->exclude_keywords_size() == 0) {
    for (const char* keyword : {"live", "remix", "acoustic", "karaoke", "instrumental", "cover", "demo", "radio edit", "tribute"}) {
      filter->add_exclude_keywords(keyword);
    }
  }
  if (filter->tight_tolerance_secs() == 0) filter->set_tight_tolerance_secs(5);
  if (filter->acceptable_tolerance_secs() == 0) filter->set_acceptable_tolerance_secs(2 * filter->tight_tolerance_secs());
  if (filter->exclusion_bound_secs() == 0) filter->set_exclusion_bound_secs(kMaxExclusionBoundSecs);

  auto* scoring = config.mutable_scoring();
  if (scoring->speed_saturation_bytes_per_sec() == 0) scoring->set_speed_saturation_bytes_per_sec(10'000'000);
  if (scoring->tie_break() == TIE_BREAK_POLICY_UNSPECIFIED) scoring->set_tie_break(TIE_BREAK_RELIABILITY_THEN_FILENAME);

  auto* analysis = config.mutable_analysis();
  if (analysis->segment_length() == 0) analysis->set_segment_length(8192);
  if (!analysis->has_overlap()) analysis->set_overlap(0.5);
  if (analysis->reference_band_low_hz() == 0) analysis->set_reference_band_low_hz(2000);
  if (analysis->reference_band_high_hz() == 0) analysis->set_reference_band_high_hz(8000);
  if (analysis->threshold_db() == 0) analysis->set_threshold_db(30);
  if (analysis->min_run_bins() == 0) analysis->set_min_run_bins(3);
  if (analysis->authentic_nyquist_ratio() == 0) analysis->set_authentic_nyquist_ratio(0.92);
  if (analysis->lossy_band_low_hz() == 0) analysis->set_lossy_band_low_hz(8000);
  if (analysis->lossy_band_high_hz() == 0) analysis->set_lossy_band_high_hz(20500);
  if (analysis->sharp_transition_db() == 0) analysis->set_sharp_transition_db(20);
  if (analysis->fake_transition_db() == 0) analysis->set_fake_transition_db(40);
  if (!analysis->has_fake_residual_db()) analysis->set_fake_residual_db(-60);
  if (analysis->sample_seconds() == 0) analysis->set_sample_seconds(30);
  if (analysis->silence_rms() == 0) analysis->set_silence_rms(0.001);
  if (analysis->min_samples() == 0) analysis->set_min_samples(4096);

  auto* workers = config.mutable_workers();
  if (workers->analysis_threads() == 0) workers->set_analysis_threads(2);
  if (workers->provider_threads() == 0) workers->set_provider_threads(4);
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  using trackmatch::util::ToMillis;

  Require(!config.provider().base_url().empty(), "provider.base_url is required");
  Require(!config.provider().api_key().empty(), "provider.api_key is required (or set TRACKMATCH_SLSKD_API_KEY)");
  Require(ToMillis(config.provider().request_timeout()).count() > 0, "provider.request_timeout must be positive");

  const auto& search = config.search();
  Require(ToMillis(search.overall_timeout()).count() > 0, "search.overall_timeout must be positive");
  Require(ToMillis(search.poll_interval()).count() > 0, "search.poll_interval must be positive");
  Require(ToMillis(search.min_tier_timeout()) <= ToMillis(search.overall_timeout()),
          "search.min_tier_timeout must not exceed search.overall_timeout");

  const auto& filter = config.filter();
  Require(filter.tight_tolerance_secs() > 0, "filter.tight_tolerance_secs must be positive");
  Require(filter.tight_tolerance_secs() < filter.acceptable_tolerance_secs(),
          "filter.acceptable_tolerance_secs must exceed filter.tight_tolerance_secs");
  Require(filter.acceptable_tolerance_secs() <= filter.exclusion_bound_secs(),
          "filter.exclusion_bound_secs must not be below filter.acceptable_tolerance_secs");
  Require(filter.exclusion_bound_secs() <= kMaxExclusionBoundSecs, "filter.exclusion_bound_secs must not exceed 30");

  Require(config.scoring().speed_saturation_bytes_per_sec() > 0, "scoring.speed_saturation_bytes_per_sec must be positive");

  const auto& analysis = config.analysis();
  Require(IsPowerOfTwo(analysis.segment_length()), "analysis.segment_length must be a power of two");
  Require(analysis.overlap() >= 0 && analysis.overlap() < 1, "analysis.overlap must be in [0, 1)");
  Require(analysis.reference_band_low_hz() < analysis.reference_band_high_hz(), "analysis reference band is empty");
  Require(analysis.lossy_band_low_hz() < analysis.lossy_band_high_hz(), "analysis lossy band is empty");
  Require(analysis.authentic_nyquist_ratio() > 0 && analysis.authentic_nyquist_ratio() <= 1,
          "analysis.authentic_nyquist_ratio must be in (0, 1]");
  Require(analysis.sharp_transition_db() <= analysis.fake_transition_db(),
          "analysis.sharp_transition_db must not exceed analysis.fake_transition_db");
  Require(analysis.fake_residual_db() < 0, "analysis.fake_residual_db must be negative");
  Require(analysis.min_run_bins() >= 1, "analysis.min_run_bins must be at least 1");
  Require(analysis.sample_seconds() > 0, "analysis.sample_seconds must be positive");

  Require(config.workers().analysis_threads() >= 1, "workers.analysis_threads must be at least 1");
  Require(config.workers().provider_threads() >= 1, "workers.provider_threads must be at least 1");
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  if (const char* api_key = std::getenv("TRACKMATCH_SLSKD_API_KEY")) {
    config.mutable_provider()->set_api_key(api_key);
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace trackmatch::config
