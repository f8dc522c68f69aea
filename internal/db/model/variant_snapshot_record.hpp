#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace repricer::db::model {

// Append-only history of observed variant state.
struct VariantSnapshotRecord {
  std::string           variant_id;
  std::string           product_id;
  int64_t               inventory_quantity = 0;
  double                price              = 0.0;
  std::optional<double> compare_at_price;
  int64_t               inventory_change = 0;
  double                price_change     = 0.0;
  std::string           reason;
  uint64_t              captured_at_ms = 0;
};

} // namespace repricer::db::model
