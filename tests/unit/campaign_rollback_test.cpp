#include "internal/rollback/campaign_rollback.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/audit/db_audit_recorder.hpp"
#include "internal/campaign/db_campaign_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/event_processor.hpp"
#include "internal/util/errors.hpp"
#include "repricer/engine/v1.hpp"
#include "test_support.hpp"

namespace {

using namespace repricer::engine::v1;
using repricer::db::memory::MemoryRepository;
using repricer::db::model::AuditRecord;
using repricer::engine::EngineContext;
using repricer::engine::EngineOptions;
using repricer::engine::EventProcessor;
using repricer::lock::LockManager;
using repricer::rollback::CampaignRollback;
using repricer::rollback::PlanRollback;
using repricer::testing::FakeGateway;
using repricer::testing::MakeCampaign;
using repricer::testing::MakeInventoryLevelEvent;
using repricer::testing::MakeRule;
using repricer::testing::MakeVariant;
using repricer::testing::ManualClock;

constexpr const char* kShop      = "demo.myshopify.com";
constexpr const char* kVariantId = "gid://shopify/ProductVariant/11";
constexpr const char* kProductId = "gid://shopify/Product/1";

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

// Engine and rollback over one in-memory store and fake platform.
struct Harness {
  Harness() {
    repo    = std::make_shared<MemoryRepository>();
    gateway = std::make_shared<FakeGateway>();
    gateway->PutVariant(MakeVariant(kVariantId, kProductId, "gid://shopify/InventoryItem/501", 20.0, 15));

    EngineOptions options;
    options.cleanup_probability = 0.0;
    options.process_id          = "rollback-test";

    EngineContext context;
    context.gateway     = gateway;
    context.campaigns   = campaigns = std::make_shared<repricer::campaign::DbCampaignRepository>(repo, clock.Fn());
    context.audit       = std::make_shared<repricer::audit::DbAuditRecorder>(repo, clock.Fn());
    context.locks       = locks = std::make_shared<LockManager>(repo, options.process_id, clock.Fn());
    context.cooldowns   = cooldowns = std::make_shared<repricer::cooldown::CooldownTracker>(repo, clock.Fn());
    context.capturer    = std::make_shared<repricer::variant::VariantStateCapturer>(repo, clock.Fn());
    context.rule_states = std::make_shared<repricer::rules::RuleStateMachine>(repo, options.rule_rearm_cooldown, clock.Fn());

    processor = std::make_unique<EventProcessor>(context, options, clock.Fn());
    rollback  = std::make_unique<CampaignRollback>(repo, context.campaigns, gateway, context.audit, locks, cooldowns,
                                                   repricer::rollback::RollbackOptions{});

    auto campaign = MakeCampaign("c1", kShop, 1);
    campaign.mutable_target()->add_product_ids(kProductId);
    *campaign.add_rules() = MakeRule("r1", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 5);
    campaigns->PutCampaign(campaign);
  }

  // Inventory 15 -> 8 raises the price from 20.00 to 25.00.
  void RaisePrice() {
    clock.Advance(std::chrono::seconds(1));
    processor->Process(MakeInventoryLevelEvent("m1", kShop, 501, 15));
    clock.Advance(std::chrono::seconds(1));
    assert(processor->Process(MakeInventoryLevelEvent("m2", kShop, 501, 8)).success());
    assert(Near(gateway->Variant(kVariantId)->price(), 25.0));
  }

  RollbackCampaignResponse Rollback(bool dry_run = false) {
    RollbackCampaignRequest req;
    req.set_campaign_id("c1");
    req.set_dry_run(dry_run);
    return rollback->Rollback(req);
  }

  std::vector<AuditRecord> Audit() {
    auto tx      = repo->Begin();
    auto entries = repo->ListAuditEntries(*tx, kVariantId);
    tx->Commit();
    return entries;
  }

  ManualClock                                               clock;
  std::shared_ptr<MemoryRepository>                         repo;
  std::shared_ptr<FakeGateway>                              gateway;
  std::shared_ptr<repricer::campaign::DbCampaignRepository> campaigns;
  std::shared_ptr<LockManager>                              locks;
  std::shared_ptr<repricer::cooldown::CooldownTracker>      cooldowns;
  std::unique_ptr<EventProcessor>                           processor;
  std::unique_ptr<CampaignRollback>                         rollback;
};

AuditRecord Entry(const std::string& variant_id, const std::string& change_type, const std::string& old_value, const std::string& message_id,
                  const std::string& error = {}) {
  AuditRecord r;
  r.shop              = kShop;
  r.entity_type       = "variant";
  r.entity_id         = variant_id;
  r.product_id        = kProductId;
  r.change_type       = change_type;
  r.old_value         = old_value;
  r.campaign_id       = "c1";
  r.source_message_id = message_id;
  r.error             = error;
  return r;
}

void TestPlanKeepsEarliestPriceSinceLastRollback() {
  std::vector<AuditRecord> entries{
      Entry("v1", "price_update", "20.00", "m1"),
      Entry("v1", "compare_at_update", "28.00", "m1"),
      Entry("v1", "price_update", "25.00", "m2"),
      Entry("v1", "compare_at_update", "30.00", "m2"),
      Entry("v2", "price_update", "10.00", "m3"),
      Entry("v2", "price_rollback", "12.00", ""),
      Entry("v3", "price_update_failed", "5.00", "m4"),
      Entry("v4", "price_update", "abc", "m5"),
      Entry("v5", "price_update", "7.50", "m6"),
      Entry("v5", "price_rollback", "9.00", "", "bridge unavailable"),
  };

  const auto plan = PlanRollback(entries);
  assert(plan.restore.size() == 2);
  assert(plan.restore[0].variant_id == "v1");
  assert(Near(plan.restore[0].price, 20.0));
  assert(plan.restore[0].compare_at && Near(*plan.restore[0].compare_at, 28.0));
  assert(plan.restore[0].shop == kShop);
  // a failed rollback leaves the variant to restore
  assert(plan.restore[1].variant_id == "v5");
  assert(Near(plan.restore[1].price, 7.5));
  assert(!plan.restore[1].compare_at.has_value());
  assert(plan.already_rolled_back == 1);

  // changed again after a rollback: restore to the price before the new change
  entries.push_back(Entry("v2", "price_update", "10.00", "m7"));
  const auto again = PlanRollback(entries);
  assert(again.restore.size() == 3);
  assert(again.restore[1].variant_id == "v2");
  assert(again.already_rolled_back == 0);
}

void TestRollbackRestoresPriceAndPausesCampaign() {
  Harness h;
  h.RaisePrice();

  auto resp = h.Rollback();
  assert(resp.restored() == 1);
  assert(resp.failed() == 0);
  assert(resp.skipped() == 0);
  assert(resp.campaign_paused());
  assert(resp.variants_size() == 1);
  assert(resp.variants(0).success());
  assert(Near(resp.variants(0).price_before(), 25.0));
  assert(Near(resp.variants(0).restored_price(), 20.0));

  assert(Near(h.gateway->Variant(kVariantId)->price(), 20.0));
  const auto calls = h.gateway->Calls();
  assert(calls.size() == 2);
  assert(Near(calls[1].price, 20.0));
  assert(calls[1].product_id == kProductId);

  const auto audit = h.Audit();
  assert(audit.size() == 2);
  assert(audit[1].change_type == "price_rollback");
  assert(audit[1].old_value == "25.00");
  assert(audit[1].new_value == "20.00");
  assert(audit[1].campaign_id == "c1");
  assert(audit[1].error.empty());

  assert(h.campaigns->GetCampaign("c1")->status() == CAMPAIGN_STATUS_PAUSED);
  assert(h.cooldowns->IsSuppressed(kVariantId, COOLDOWN_TYPE_PRICE_UPDATE));
  assert(!h.processor->Process(MakeInventoryLevelEvent("m3", kShop, 501, 5)).success());

  auto second = h.Rollback();
  assert(second.restored() == 0);
  assert(second.skipped() == 1);
  assert(second.variants_size() == 0);
  assert(!second.campaign_paused());
  assert(h.gateway->Calls().size() == 2);
}

void TestDryRunChangesNothing() {
  Harness h;
  h.RaisePrice();

  auto resp = h.Rollback(true);
  assert(resp.variants_size() == 1);
  assert(resp.variants(0).variant_id() == kVariantId);
  assert(Near(resp.variants(0).restored_price(), 20.0));
  assert(!resp.variants(0).success());
  assert(resp.restored() == 0);
  assert(!resp.campaign_paused());

  assert(h.gateway->Calls().size() == 1);
  assert(Near(h.gateway->Variant(kVariantId)->price(), 25.0));
  assert(h.campaigns->GetCampaign("c1")->status() == CAMPAIGN_STATUS_ACTIVE);
  assert(h.Audit().size() == 1);
}

void TestRejectedRestoreIsRetried() {
  Harness h;
  h.RaisePrice();
  h.gateway->reject_next = 1;

  auto failed = h.Rollback();
  assert(failed.failed() == 1);
  assert(failed.restored() == 0);
  assert(!failed.variants(0).success());
  assert(!failed.variants(0).error().empty());
  assert(Near(h.gateway->Variant(kVariantId)->price(), 25.0));

  auto audit = h.Audit();
  assert(audit.size() == 2);
  assert(audit[1].change_type == "price_rollback");
  assert(!audit[1].error.empty());

  auto retried = h.Rollback();
  assert(retried.restored() == 1);
  assert(Near(h.gateway->Variant(kVariantId)->price(), 20.0));
}

void TestLockedVariantIsReportedAndLeftAlone() {
  Harness h;
  h.RaisePrice();

  LockManager other(h.repo, "other-instance", h.clock.Fn());
  assert(other.TryAcquire(LockManager::VariantKey(kVariantId), LOCK_TYPE_CAMPAIGN_EXECUTION, std::chrono::seconds(120)).has_value());

  auto resp = h.Rollback();
  assert(resp.failed() == 1);
  assert(resp.variants(0).error() == "variant locked");
  assert(h.gateway->Calls().size() == 1);
  assert(h.Audit().size() == 1);
}

void TestVariantFilterAndValidation() {
  Harness h;
  h.RaisePrice();

  RollbackCampaignRequest req;
  req.set_campaign_id("c1");
  req.add_variant_ids("99");
  auto none = h.rollback->Rollback(req);
  assert(none.variants_size() == 0);
  assert(Near(h.gateway->Variant(kVariantId)->price(), 25.0));

  req.clear_variant_ids();
  req.add_variant_ids("11");
  auto bare = h.rollback->Rollback(req);
  assert(bare.restored() == 1);

  bool threw = false;
  try {
    h.rollback->Rollback(RollbackCampaignRequest());
  } catch (const repricer::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  req.set_campaign_id("missing");
  try {
    h.rollback->Rollback(req);
  } catch (const repricer::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPlanKeepsEarliestPriceSinceLastRollback();
  TestRollbackRestoresPriceAndPausesCampaign();
  TestDryRunChangesNothing();
  TestRejectedRestoreIsRetried();
  TestLockedVariantIsReportedAndLeftAlone();
  TestVariantFilterAndValidation();

  std::cout << "repricer_unit_campaign_rollback: pass\n";
  return 0;
}
