#pragma once

#include <cstdint>
#include <string>

#include "repricer/engine/v1/state.pb.h"

namespace repricer::db::model {

/*
  Execution state of one rule against one variant.

  Unique on (campaign_id, rule_id, variant_id). Written on every
  evaluation, never deleted by the engine.
*/

struct RuleStateRecord {
  std::string campaign_id;
  std::string rule_id;
  std::string variant_id;

  repricer::engine::v1::RuleState state = repricer::engine::v1::RULE_STATE_INACTIVE;

  int64_t  last_inventory    = 0;
  double   last_price        = 0.0;
  uint64_t trigger_count     = 0;
  uint64_t triggered_at_ms   = 0; // 0 = never
  uint64_t cooldown_until_ms = 0; // 0 = none
  uint64_t updated_at_ms     = 0;
};

} // namespace repricer::db::model
