#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "awacs_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(controller:
  callsign: "Dark Star"
  coalition: COALITION_RED
telemetry:
  host: "10.0.0.5"
  port: 42674
  password_hash: "0"
  staleness_window: "45s"
radio:
  frequencies: [251000000, 264000000]
  unit_name: "Dark Star"
sessions:
  tick_interval: "0.25s"
  transcription_attempts: 3
admin:
  bind_address: "127.0.0.1:50070"
logging:
  level: debug
)");

  auto config = awacs::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.controller().callsign() == "Dark Star");
  assert(config.controller().coalition() == awacs::runtime::config::COALITION_RED);
  assert(config.telemetry().password_hash() == "0");
  assert(config.telemetry().port() == 42674);
  assert(config.telemetry().staleness_window().seconds() == 45);
  assert(config.radio().frequencies_size() == 2);
  assert(config.radio().frequencies(1) == 264000000u);
  assert(config.sessions().tick_interval().nanos() == 250000000);
  assert(config.sessions().transcription_attempts() == 3);
  assert(config.logging().level() == "debug");
}

void TestScalarEscaping() {
  const auto config = awacs::config::ConfigLoader::LoadFromYamlString(R"(speech:
  api_key: "C:\\keys\\\"quoted\"\\key"
  voice: "line1\nline2☃"
)");
  assert(config.speech().api_key() == "C:\\keys\\\"quoted\"\\key");
  assert(config.speech().voice() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  const auto config = awacs::config::ConfigLoader::LoadFromYamlString(R"(telemetry:
  username: "12345"
)");
  assert(config.telemetry().username() == "12345");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)awacs::config::ConfigLoader::LoadFromYamlString(R"(controller:
  callsign: "Overlord"
  callsing: "typo"
)");
  } catch (const awacs::util::InvalidConfig&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsInvalidConfig() {
  bool threw = false;
  try {
    (void)awacs::config::ConfigLoader::LoadFromYaml("/nonexistent/awacs.yaml");
  } catch (const awacs::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestScalarEscaping();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsInvalidConfig();

  std::cout << "awacs_unit_config_loader: pass\n";
  return 0;
}
