#pragma once

#include <cstdint>
#include <string>

#include "repricer/engine/v1/campaign.pb.h"

namespace repricer::db::model {

/*
  Campaign row.

  The full definition (targets, rules) is kept as protobuf JSON:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string

  Columns duplicated out of the definition are authoritative; the
  engine only ever mutates trigger_count and last_triggered_at_ms.
*/

struct CampaignRecord {
  std::string                          id;
  std::string                          shop;
  repricer::engine::v1::CampaignStatus status = repricer::engine::v1::CAMPAIGN_STATUS_DRAFT;
  int32_t                              priority = 0;
  uint64_t                             trigger_count        = 0;
  uint64_t                             last_triggered_at_ms = 0;
  std::string                          definition_json;
  uint64_t                             updated_at_ms = 0;
};

} // namespace repricer::db::model
