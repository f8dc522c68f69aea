#include "internal/engine/engine_options.hpp"

#include "config/config.pb.h"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace repricer::engine {

EngineOptions EngineOptions::FromConfig(const repricer::runtime::config::EngineConfig& config) {
  EngineOptions options;

  if (config.has_message_lock_ttl()) options.message_lock_ttl = util::ToMillis(config.message_lock_ttl(), options.message_lock_ttl);
  if (config.has_variant_lock_ttl()) options.variant_lock_ttl = util::ToMillis(config.variant_lock_ttl(), options.variant_lock_ttl);
  if (config.has_price_update_cooldown()) {
    options.price_update_cooldown = util::ToMillis(config.price_update_cooldown(), options.price_update_cooldown);
  }
  if (config.has_campaign_cooldown()) options.campaign_cooldown = util::ToMillis(config.campaign_cooldown(), options.campaign_cooldown);
  if (config.has_self_echo_window()) options.self_echo_window = util::ToMillis(config.self_echo_window(), options.self_echo_window);
  if (config.has_rule_rearm_cooldown()) {
    options.rule_rearm_cooldown = util::ToMillis(config.rule_rearm_cooldown(), options.rule_rearm_cooldown);
  }
  if (config.has_cleanup_probability()) options.cleanup_probability = config.cleanup_probability();

  options.process_id = config.process_id().empty() ? util::GenerateId("repricer") : config.process_id();
  return options;
}

} // namespace repricer::engine
