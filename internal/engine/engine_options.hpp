#pragma once

#include <chrono>
#include <string>

namespace repricer::runtime::config {
class EngineConfig;
}

namespace repricer::engine {

// Deployment-wide tuning of the event processor.
struct EngineOptions {
  std::chrono::milliseconds message_lock_ttl{std::chrono::seconds(60)};
  std::chrono::milliseconds variant_lock_ttl{std::chrono::seconds(120)};
  std::chrono::milliseconds price_update_cooldown{std::chrono::seconds(120)};
  std::chrono::milliseconds campaign_cooldown{std::chrono::seconds(60)};
  std::chrono::milliseconds self_echo_window{std::chrono::seconds(60)};
  std::chrono::milliseconds rule_rearm_cooldown{0};

  // Chance per accepted event of sweeping expired locks and cooldowns.
  double cleanup_probability = 0.1;

  // Lock owner identity; generated when empty.
  std::string process_id;

  static EngineOptions FromConfig(const repricer::runtime::config::EngineConfig& config);
};

} // namespace repricer::engine
