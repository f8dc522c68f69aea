#include "internal/audit/db_audit_recorder.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

#include "internal/util/uuid.hpp"

namespace repricer::audit {

namespace {

std::string Money(double value) {
  return fmt::format("{:.2f}", value);
}

std::string Money(const std::optional<double>& value) {
  return value ? Money(*value) : std::string();
}

} // namespace

DbAuditRecorder::DbAuditRecorder(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void DbAuditRecorder::RecordPriceChange(const PriceChange& change) {
  db::model::AuditRecord base;
  base.shop              = change.shop;
  base.entity_type       = "variant";
  base.entity_id         = change.variant_id;
  base.product_id        = change.product_id;
  base.trigger_reason    = change.reason;
  base.campaign_id       = change.campaign_id;
  base.source_message_id = change.source_message_id;
  base.created_at_ms     = util::ToUnixMillis(clock_());

  auto tx = repository_->Begin();

  auto price_entry        = base;
  price_entry.id          = util::GenerateId("audit");
  if (change.kind == ChangeKind::kRollback) {
    price_entry.change_type = "price_rollback";
  } else {
    price_entry.change_type = change.success ? "price_update" : "price_update_failed";
  }
  price_entry.old_value   = Money(change.old_price);
  price_entry.new_value   = Money(change.new_price);
  price_entry.error       = change.error;
  db::ThrowIfError(repository_->InsertAuditEntry(*tx, price_entry), "record price change");

  if (change.kind == ChangeKind::kCampaignUpdate && change.success && change.new_compare_at && change.new_compare_at != change.old_compare_at) {
    auto compare_entry        = base;
    compare_entry.id          = util::GenerateId("audit");
    compare_entry.change_type = "compare_at_update";
    compare_entry.old_value   = Money(change.old_compare_at);
    compare_entry.new_value   = Money(change.new_compare_at);
    db::ThrowIfError(repository_->InsertAuditEntry(*tx, compare_entry), "record compare-at change");
  }

  tx->Commit();
}

} // namespace repricer::audit
