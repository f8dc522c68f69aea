#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/engine/engine_options.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "repricer_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/repricer/repricer.db"
    wal_mode: true
logging:
  level: debug
engine:
  message_lock_ttl: 30s
  variant_lock_ttl: 90s
  price_update_cooldown: 300s
  campaign_cooldown: 45s
  self_echo_window: 20s
  rule_rearm_cooldown: 600s
  cleanup_probability: 0.25
  process_id: "repricer-a"
gateway:
  endpoint: "bridge:50070"
  timeout: 5s
  insecure: true
)");

  const auto config = repricer::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.gateway().endpoint() == "bridge:50070");
  assert(config.gateway().timeout().seconds() == 5);

  const auto options = repricer::engine::EngineOptions::FromConfig(config.engine());
  assert(options.message_lock_ttl == std::chrono::seconds(30));
  assert(options.variant_lock_ttl == std::chrono::seconds(90));
  assert(options.price_update_cooldown == std::chrono::seconds(300));
  assert(options.campaign_cooldown == std::chrono::seconds(45));
  assert(options.self_echo_window == std::chrono::seconds(20));
  assert(options.rule_rearm_cooldown == std::chrono::seconds(600));
  assert(options.cleanup_probability == 0.25);
  assert(options.process_id == "repricer-a");
}

void TestEngineDefaults() {
  const auto config  = repricer::config::ConfigLoader::ParseYaml("server:\n  bind_address: \"127.0.0.1:50061\"\n");
  const auto options = repricer::engine::EngineOptions::FromConfig(config.engine());

  assert(!config.database().has_sqlite() && !config.database().has_postgres());
  assert(options.message_lock_ttl == std::chrono::seconds(60));
  assert(options.variant_lock_ttl == std::chrono::seconds(120));
  assert(options.price_update_cooldown == std::chrono::seconds(120));
  assert(options.campaign_cooldown == std::chrono::seconds(60));
  assert(options.self_echo_window == std::chrono::seconds(60));
  assert(options.rule_rearm_cooldown == std::chrono::milliseconds(0));
  assert(options.cleanup_probability == 0.1);
  assert(options.process_id.rfind("repricer", 0) == 0);
}

void TestQuotedScalarsStayStrings() {
  const auto config = repricer::config::ConfigLoader::ParseYaml(R"(engine:
  process_id: "12345"
database:
  sqlite:
    path: "C:\\repricer\\\"quoted\"\\db.sqlite"
)");
  assert(config.engine().process_id() == "12345");
  assert(config.database().sqlite().path() == "C:\\repricer\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)repricer::config::ConfigLoader::ParseYaml("server:\n  bind_address: \"0.0.0.0:1\"\nunknown_field: 123\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedDurationIsRejected() {
  bool threw = false;
  try {
    (void)repricer::config::ConfigLoader::ParseYaml("engine:\n  campaign_cooldown: \"one minute\"\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestOutOfRangeValuesAreRejected() {
  bool threw = false;
  try {
    (void)repricer::config::ConfigLoader::ParseYaml("engine:\n  cleanup_probability: 1.5\n");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)repricer::config::ConfigLoader::ParseYaml("engine:\n  variant_lock_ttl: -5s\n");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)repricer::config::ConfigLoader::ParseYaml("database:\n  postgres:\n    max_connections: 4\n");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    (void)repricer::config::ConfigLoader::LoadFromYaml("/nonexistent/repricer.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestEngineDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMalformedDurationIsRejected();
  TestOutOfRangeValuesAreRejected();
  TestMissingFileFails();

  std::cout << "repricer_unit_config_loader: pass\n";
  return 0;
}
