#pragma once

#include <cstdint>
#include <string>

#include "repricer/engine/v1/state.pb.h"

namespace repricer::db::model {

/*
  Suppression window, unique on (cooldown_key, type).

  cooldown_key is a variant id for PRICE_UPDATE and
  "campaign_<id>" for CAMPAIGN_TRIGGER.
*/

struct CooldownRecord {
  std::string                       cooldown_key;
  repricer::engine::v1::CooldownType type = repricer::engine::v1::COOLDOWN_TYPE_UNSPECIFIED;
  std::string                       campaign_id;
  uint64_t                          expires_at_ms = 0;
  uint64_t                          updated_at_ms = 0;
};

} // namespace repricer::db::model
