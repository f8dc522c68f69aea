#pragma once

#include <cstdint>
#include <string>

namespace repricer::db::model {

/*
  Audit trail entry. Append-only.

  change_type: price_update | compare_at_update | price_update_failed | price_rollback
  old_value/new_value are decimal strings with two fractional digits.
*/

struct AuditRecord {
  std::string id;
  std::string shop;
  std::string entity_type; // "variant"
  std::string entity_id;
  std::string product_id;
  std::string change_type;
  std::string old_value;
  std::string new_value;
  std::string trigger_reason;
  std::string campaign_id;
  std::string source_message_id;
  std::string error;
  uint64_t    created_at_ms = 0;
};

} // namespace repricer::db::model
