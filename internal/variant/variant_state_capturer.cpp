#include "internal/variant/variant_state_capturer.hpp"

#include <cmath>
#include <utility>

#include "internal/observability/logging.hpp"

namespace repricer::variant {

using repricer::observability::DoubleField;
using repricer::observability::IntField;
using repricer::observability::StringField;

namespace {

constexpr double kPriceEpsilon = 0.01;

} // namespace

VariantStateCapturer::VariantStateCapturer(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

VariantSnapshot VariantStateCapturer::Capture(const repricer::engine::v1::VariantDetails& details, std::optional<int64_t> event_inventory,
                                              const std::string& reason) {
  VariantSnapshot snapshot;
  snapshot.variant_id        = details.variant_id();
  snapshot.product_id        = details.product_id();
  snapshot.inventory         = event_inventory.value_or(details.inventory_quantity());
  snapshot.price             = details.price();
  snapshot.inventory_tracked = details.inventory_tracked();
  snapshot.captured_at       = clock_();
  if (details.has_compare_at_price()) {
    snapshot.compare_at_price = details.compare_at_price();
  }

  AppendHistory(snapshot, reason);
  return snapshot;
}

void VariantStateCapturer::AppendHistory(const VariantSnapshot& snapshot, const std::string& reason) {
  try {
    auto tx       = repository_->Begin();
    auto previous = repository_->GetLatestVariantSnapshot(*tx, snapshot.variant_id);

    db::model::VariantSnapshotRecord record;
    record.variant_id         = snapshot.variant_id;
    record.product_id         = snapshot.product_id;
    record.inventory_quantity = snapshot.inventory;
    record.price              = snapshot.price;
    record.compare_at_price   = snapshot.compare_at_price;
    record.reason             = reason.empty() ? "webhook_update" : reason;
    record.captured_at_ms     = util::ToUnixMillis(snapshot.captured_at);

    if (previous) {
      record.inventory_change = snapshot.inventory - previous->inventory_quantity;
      record.price_change     = snapshot.price - previous->price;
      if (record.inventory_change == 0 && std::fabs(record.price_change) <= kPriceEpsilon) {
        return;
      }
    }

    auto result = repository_->InsertVariantSnapshot(*tx, record);
    if (!result) {
      REPRICER_LOG_WARN("variant history write failed", {StringField("variant_id", snapshot.variant_id), StringField("error", result.message)});
      return;
    }
    tx->Commit();

    REPRICER_LOG_DEBUG("variant state captured", {StringField("variant_id", snapshot.variant_id), IntField("inventory_change", record.inventory_change),
                                                  DoubleField("price_change", record.price_change)});
  } catch (const std::exception& e) {
    REPRICER_LOG_WARN("variant history write failed", {StringField("variant_id", snapshot.variant_id), StringField("error", e.what())});
  }
}

} // namespace repricer::variant
