#pragma once

#include <google/protobuf/struct.pb.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/gateway/commerce_gateway.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "repricer/engine/v1/campaign.pb.h"
#include "repricer/engine/v1/event.pb.h"
#include "repricer/engine/v1/variant.pb.h"

namespace repricer::testing {

// Clock the test moves by hand.
class ManualClock {
 public:
  ManualClock() : now_ms_(static_cast<int64_t>(util::ToUnixMillis(util::Now()))) {
  }

  util::TimePoint Now() const {
    return util::FromUnixMillis(static_cast<uint64_t>(now_ms_.load()));
  }

  void Advance(std::chrono::milliseconds by) {
    now_ms_ += by.count();
  }

  util::ClockFn Fn() {
    return [this] { return Now(); };
  }

 private:
  std::atomic<int64_t> now_ms_;
};

struct PriceCall {
  std::string           product_id;
  std::string           variant_id;
  double                price = 0.0;
  std::optional<double> compare_at_price;
};

/*
  In-memory commerce platform. Variants are registered up front;
  successful price updates are applied to the stored variant.
*/
class FakeGateway final : public gateway::CommerceGateway {
 public:
  void PutVariant(const repricer::engine::v1::VariantDetails& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    variants_[details.variant_id()] = details;
  }

  std::optional<repricer::engine::v1::VariantDetails> Variant(const std::string& variant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = variants_.find(variant_id);
    if (it == variants_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<repricer::engine::v1::VariantDetails> GetVariant(const std::string&, const std::string& variant_id) override {
    return Variant(variant_id);
  }

  std::optional<repricer::engine::v1::VariantDetails> GetVariantByInventoryItem(const std::string&, const std::string& inventory_item_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, details] : variants_) {
      if (details.inventory_item_id() == inventory_item_id) return details;
    }
    return std::nullopt;
  }

  repricer::engine::v1::PriceUpdateResult UpdateVariantPrice(const std::string&, const std::string& product_id, const std::string& variant_id,
                                                             double price, std::optional<double> compare_at_price) override {
    if (update_delay.count() > 0) {
      std::this_thread::sleep_for(update_delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back({product_id, variant_id, price, compare_at_price});

    if (throw_next > 0) {
      --throw_next;
      throw util::GatewayError("bridge unavailable");
    }

    repricer::engine::v1::PriceUpdateResult result;
    if (reject_next > 0 || reject_all) {
      if (reject_next > 0) --reject_next;
      result.set_success(false);
      result.add_errors("price: must be greater than or equal to 0");
      return result;
    }

    auto& stored = variants_[variant_id];
    stored.set_price(price);
    if (compare_at_price) stored.set_compare_at_price(*compare_at_price);
    result.set_success(true);
    *result.mutable_updated_variant() = stored;
    return result;
  }

  std::vector<PriceCall> Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  int  reject_next = 0;
  int  throw_next  = 0;
  bool reject_all  = false;

  std::chrono::milliseconds update_delay{0};

 private:
  mutable std::mutex                                          mutex_;
  std::map<std::string, repricer::engine::v1::VariantDetails> variants_;
  std::vector<PriceCall>                                      calls_;
};

/*
  Pass-through repository that can make the rule state table
  unavailable, for degraded-mode tests.
*/
class DelegatingRepository final : public db::Repository {
 public:
  explicit DelegatingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::atomic<bool> fail_rule_states{false};
  std::atomic<bool> fail_trigger_counts{false};

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertLock(db::Transaction& tx, const db::model::LockRecord& r) override {
    return inner_->InsertLock(tx, r);
  }
  std::optional<db::model::LockRecord> GetLock(db::Transaction& tx, const std::string& key) override {
    return inner_->GetLock(tx, key);
  }
  db::Result ReclaimExpiredLock(db::Transaction& tx, const db::model::LockRecord& r, uint64_t now_ms) override {
    return inner_->ReclaimExpiredLock(tx, r, now_ms);
  }
  db::Result DeleteLock(db::Transaction& tx, const std::string& key, const std::string& owner) override {
    return inner_->DeleteLock(tx, key, owner);
  }
  db::Result DeleteExpiredLocks(db::Transaction& tx, uint64_t now_ms, uint64_t* removed) override {
    return inner_->DeleteExpiredLocks(tx, now_ms, removed);
  }

  db::Result UpsertCooldown(db::Transaction& tx, const db::model::CooldownRecord& r) override {
    return inner_->UpsertCooldown(tx, r);
  }
  std::optional<db::model::CooldownRecord> GetCooldown(db::Transaction& tx, const std::string& key,
                                                       repricer::engine::v1::CooldownType type) override {
    return inner_->GetCooldown(tx, key, type);
  }
  db::Result DeleteCooldown(db::Transaction& tx, const std::string& key, repricer::engine::v1::CooldownType type) override {
    return inner_->DeleteCooldown(tx, key, type);
  }
  std::vector<db::model::CooldownRecord> ListCooldowns(db::Transaction& tx, const std::string& key) override {
    return inner_->ListCooldowns(tx, key);
  }
  db::Result DeleteExpiredCooldowns(db::Transaction& tx, uint64_t now_ms, uint64_t* removed) override {
    return inner_->DeleteExpiredCooldowns(tx, now_ms, removed);
  }

  std::optional<db::model::RuleStateRecord> GetRuleState(db::Transaction& tx, const std::string& campaign_id, const std::string& rule_id,
                                                         const std::string& variant_id) override {
    if (fail_rule_states) throw std::runtime_error("rule_execution_states unavailable");
    return inner_->GetRuleState(tx, campaign_id, rule_id, variant_id);
  }
  db::Result UpsertRuleState(db::Transaction& tx, const db::model::RuleStateRecord& r) override {
    if (fail_rule_states) return db::Result::Err(db::ErrorCode::IOError, "rule_execution_states unavailable");
    return inner_->UpsertRuleState(tx, r);
  }
  std::vector<db::model::RuleStateRecord> ListRuleStates(db::Transaction& tx, const std::string& variant_id) override {
    return inner_->ListRuleStates(tx, variant_id);
  }

  db::Result InsertVariantSnapshot(db::Transaction& tx, const db::model::VariantSnapshotRecord& r) override {
    return inner_->InsertVariantSnapshot(tx, r);
  }
  std::optional<db::model::VariantSnapshotRecord> GetLatestVariantSnapshot(db::Transaction& tx, const std::string& variant_id) override {
    return inner_->GetLatestVariantSnapshot(tx, variant_id);
  }

  db::Result InsertAuditEntry(db::Transaction& tx, const db::model::AuditRecord& r) override {
    return inner_->InsertAuditEntry(tx, r);
  }
  std::vector<db::model::AuditRecord> ListAuditEntries(db::Transaction& tx, const std::string& entity_id) override {
    return inner_->ListAuditEntries(tx, entity_id);
  }
  std::vector<db::model::AuditRecord> ListCampaignAuditEntries(db::Transaction& tx, const std::string& campaign_id) override {
    return inner_->ListCampaignAuditEntries(tx, campaign_id);
  }

  db::Result UpsertCampaign(db::Transaction& tx, const db::model::CampaignRecord& r) override {
    return inner_->UpsertCampaign(tx, r);
  }
  std::optional<db::model::CampaignRecord> GetCampaign(db::Transaction& tx, const std::string& id) override {
    return inner_->GetCampaign(tx, id);
  }
  std::vector<db::model::CampaignRecord> ListCampaigns(db::Transaction& tx, const std::string& shop,
                                                       repricer::engine::v1::CampaignStatus status) override {
    return inner_->ListCampaigns(tx, shop, status);
  }
  db::Result IncrementCampaignTriggerCount(db::Transaction& tx, const std::string& id, uint64_t triggered_at_ms) override {
    if (fail_trigger_counts) return db::Result::Err(db::ErrorCode::IOError, "campaigns unavailable");
    return inner_->IncrementCampaignTriggerCount(tx, id, triggered_at_ms);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
};

inline repricer::engine::v1::PricingRule MakeRule(const std::string& id, repricer::engine::v1::ConditionKind condition, double threshold,
                                                  repricer::engine::v1::PriceAction action, repricer::engine::v1::PriceMode mode,
                                                  double value) {
  repricer::engine::v1::PricingRule rule;
  rule.set_id(id);
  rule.set_when_condition(condition);
  rule.set_when_value(threshold);
  rule.set_then_action(action);
  rule.set_then_mode(mode);
  rule.set_then_value(value);
  return rule;
}

inline repricer::engine::v1::Campaign MakeCampaign(const std::string& id, const std::string& shop, int32_t priority) {
  repricer::engine::v1::Campaign campaign;
  campaign.set_id(id);
  campaign.set_name("campaign " + id);
  campaign.set_shop(shop);
  campaign.set_status(repricer::engine::v1::CAMPAIGN_STATUS_ACTIVE);
  campaign.set_priority(priority);
  return campaign;
}

inline repricer::engine::v1::VariantDetails MakeVariant(const std::string& variant_id, const std::string& product_id,
                                                        const std::string& inventory_item_id, double price, int64_t inventory) {
  repricer::engine::v1::VariantDetails details;
  details.set_variant_id(variant_id);
  details.set_product_id(product_id);
  details.set_inventory_item_id(inventory_item_id);
  details.set_price(price);
  details.set_inventory_quantity(inventory);
  details.set_inventory_tracked(true);
  return details;
}

inline repricer::engine::v1::InventoryChangeEvent MakeInventoryLevelEvent(const std::string& message_id, const std::string& shop,
                                                                          int64_t inventory_item_id, int64_t available) {
  repricer::engine::v1::InventoryChangeEvent event;
  event.set_message_id(message_id);
  event.set_topic("inventory_levels/update");
  event.set_shop_domain(shop);
  auto& fields = *event.mutable_payload()->mutable_fields();
  fields["inventory_item_id"].set_number_value(static_cast<double>(inventory_item_id));
  fields["available"].set_number_value(static_cast<double>(available));
  return event;
}

} // namespace repricer::testing
