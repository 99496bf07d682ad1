#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

using trackmatch::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "trackmatch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadFails(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsFillUnsetSections() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(provider:
  api_key: secret
search:
  overall_timeout: "45s"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.provider().api_key() == "secret");
  assert(config.provider().base_url() == "http://localhost:5030");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(trackmatch::util::ToMillis(config.search().overall_timeout()).count() == 45000);
  assert(trackmatch::util::ToMillis(config.search().poll_interval()).count() == 2000);
  assert(config.search().max_results() == 10);
  assert(config.filter().preferred_extension() == "flac");
  assert(config.filter().fallback_extensions_size() == 9);
  assert(config.filter().fallback_extensions(0) == "alac");
  assert(config.analysis().segment_length() == 8192);
  assert(config.analysis().overlap() == 0.5);
  assert(config.scoring().tie_break() == trackmatch::runtime::config::TIE_BREAK_RELIABILITY_THEN_FILENAME);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(provider:
  api_key: "12345"
  base_url: "http://slskd.local:5030"
filter:
  exclude_keywords: ["live", "radio edit"]
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.provider().api_key() == "12345");
  assert(config.provider().base_url() == "http://slskd.local:5030");
  assert(config.filter().exclude_keywords_size() == 2);
  assert(config.filter().exclude_keywords(1) == "radio edit");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(provider:
  api_key: secret
unknown_field: 123
)");

  assert(LoadFails(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingApiKeyIsRejected() {
  const auto yaml_path = WriteYaml("missing_key",
                                   R"(provider:
  base_url: http://localhost:5030
)");

  assert(LoadFails(yaml_path));
}

void TestEnvironmentOverridesApiKey() {
  const auto yaml_path = WriteYaml("env_key",
                                   R"(provider:
  api_key: from-file
)");

  setenv("TRACKMATCH_SLSKD_API_KEY", "from-env", 1);
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  unsetenv("TRACKMATCH_SLSKD_API_KEY");

  assert(config.provider().api_key() == "from-env");
}

void TestInconsistentValuesAreRejected() {
  assert(LoadFails(WriteYaml("segment_length",
                             R"(provider:
  api_key: secret
analysis:
  segment_length: 1000
)")));

  assert(LoadFails(WriteYaml("tier_timeout",
                             R"(provider:
  api_key: secret
search:
  overall_timeout: 5s
  min_tier_timeout: 10s
)")));

  assert(LoadFails(WriteYaml("bounds",
                             R"(provider:
  api_key: secret
filter:
  tight_tolerance_secs: 20
  exclusion_bound_secs: 30
)")));
}

void TestDurationTolerancesMustBeOrdered() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("tolerances",
                                                     R"(provider:
  api_key: secret
filter:
  tight_tolerance_secs: 3
  acceptable_tolerance_secs: 12
  exclusion_bound_secs: 20
)")
                                               .string());
  assert(config.filter().tight_tolerance_secs() == 3);
  assert(config.filter().acceptable_tolerance_secs() == 12);
  assert(config.filter().exclusion_bound_secs() == 20);

  assert(ConfigLoader::Defaults().filter().acceptable_tolerance_secs() == 10);

  // acceptable not above tight
  assert(LoadFails(WriteYaml("acceptable_below_tight",
                             R"(provider:
  api_key: secret
filter:
  tight_tolerance_secs: 8
  acceptable_tolerance_secs: 8
)")));

  // bound below acceptable
  assert(LoadFails(WriteYaml("bound_below_acceptable",
                             R"(provider:
  api_key: secret
filter:
  acceptable_tolerance_secs: 15
  exclusion_bound_secs: 12
)")));

  // a 60s bound would report candidates more than 30s off
  assert(LoadFails(WriteYaml("bound_above_thirty",
                             R"(provider:
  api_key: secret
filter:
  exclusion_bound_secs: 60
)")));
}

void TestDefaultsValidate() {
  auto config = ConfigLoader::Defaults();
  config.mutable_provider()->set_api_key("k");
  ConfigLoader::Validate(config);
}

} // namespace

int main() {
  unsetenv("TRACKMATCH_SLSKD_API_KEY");

  TestDefaultsFillUnsetSections();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingApiKeyIsRejected();
  TestEnvironmentOverridesApiKey();
  TestInconsistentValuesAreRejected();
  TestDurationTolerancesMustBeOrdered();
  TestDefaultsValidate();

  std::cout << "trackmatch_unit_config_loader: pass\n";
  return 0;
}
