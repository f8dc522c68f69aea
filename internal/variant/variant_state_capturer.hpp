#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "repricer/engine/v1/variant.pb.h"

namespace repricer::variant {

// Observed variant state at evaluation time.
struct VariantSnapshot {
  std::string           variant_id;
  std::string           product_id;
  int64_t               inventory = 0;
  double                price     = 0.0;
  std::optional<double> compare_at_price;
  bool                  inventory_tracked = true;
  util::TimePoint       captured_at;
};

/*
  Builds the snapshot rules are evaluated against and keeps the
  variant state history.

  A history row is appended for the first observation of a variant and
  afterwards only when inventory changed or the price moved by more
  than one cent. History is informational; failing to write it never
  fails the capture.
*/
class VariantStateCapturer {
 public:
  explicit VariantStateCapturer(std::shared_ptr<db::Repository> repository, util::ClockFn clock = util::Now);

  // event_inventory, when present, overrides the platform-reported quantity
  // (inventory level events carry the new level before the platform
  // read-model catches up).
  VariantSnapshot Capture(const repricer::engine::v1::VariantDetails& details, std::optional<int64_t> event_inventory,
                          const std::string& reason);

 private:
  void AppendHistory(const VariantSnapshot& snapshot, const std::string& reason);

  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

} // namespace repricer::variant
