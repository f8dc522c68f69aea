#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if REPRICER_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if REPRICER_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using namespace repricer::engine::v1;
using repricer::db::ErrorCode;
using repricer::db::Repository;
using repricer::db::memory::MemoryRepository;
using repricer::db::model::AuditRecord;
using repricer::db::model::CampaignRecord;
using repricer::db::model::CooldownRecord;
using repricer::db::model::LockRecord;
using repricer::db::model::RuleStateRecord;
using repricer::db::model::VariantSnapshotRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

LockRecord MakeLock(const std::string& key, const std::string& owner, uint64_t expires_at_ms) {
  LockRecord lock;
  lock.lock_key      = key;
  lock.type          = LOCK_TYPE_CAMPAIGN_EXECUTION;
  lock.owner         = owner;
  lock.expires_at_ms = expires_at_ms;
  lock.created_at_ms = NowMs();
  return lock;
}

void VerifyLockLifecycle(Repository& repo, const std::string& key) {
  const auto now = NowMs();

  {
    auto tx = repo.Begin();
    assert(repo.InsertLock(*tx, MakeLock(key, "owner-a", now + 60'000)));
    tx->Commit();
  }
  {
    auto tx     = repo.Begin();
    auto second = repo.InsertLock(*tx, MakeLock(key, "owner-b", now + 60'000));
    assert(!second && second.code == ErrorCode::AlreadyExists);

    auto live = repo.ReclaimExpiredLock(*tx, MakeLock(key, "owner-b", now + 60'000), now);
    assert(!live && live.code == ErrorCode::Conflict);

    auto stored = repo.GetLock(*tx, key);
    assert(stored.has_value());
    assert(stored->owner == "owner-a");
    assert(stored->type == LOCK_TYPE_CAMPAIGN_EXECUTION);
    tx->Commit();
  }
  {
    // once expired another owner may take it over
    auto tx = repo.Begin();
    assert(repo.ReclaimExpiredLock(*tx, MakeLock(key, "owner-b", now + 240'000), now + 120'000));

    auto stale = repo.DeleteLock(*tx, key, "owner-a");
    assert(!stale && stale.code == ErrorCode::NotFound);
    assert(repo.GetLock(*tx, key)->owner == "owner-b");

    assert(repo.DeleteLock(*tx, key, "owner-b"));
    assert(!repo.GetLock(*tx, key).has_value());
    tx->Commit();
  }
}

void VerifyLockRace(Repository& repo, const std::string& key) {
  std::atomic<int>         winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i] {
      auto tx     = repo.Begin();
      auto result = repo.InsertLock(*tx, MakeLock(key, "owner-" + std::to_string(i), NowMs() + 60'000));
      if (result) {
        ++winners;
        tx->Commit();
      } else {
        assert(result.code == ErrorCode::AlreadyExists);
        tx->Rollback();
      }
    });
  }
  for (auto& t : threads) t.join();
  assert(winners == 1);

  auto     tx      = repo.Begin();
  uint64_t removed = 0;
  assert(repo.DeleteExpiredLocks(*tx, NowMs() + 120'000, &removed));
  assert(removed >= 1);
  assert(!repo.GetLock(*tx, key).has_value());
  tx->Commit();
}

void VerifyCooldowns(Repository& repo, const std::string& key) {
  const auto now = NowMs();
  {
    auto           tx = repo.Begin();
    CooldownRecord price{.cooldown_key = key, .type = COOLDOWN_TYPE_PRICE_UPDATE, .campaign_id = "", .expires_at_ms = now + 1'000, .updated_at_ms = now};
    assert(repo.UpsertCooldown(*tx, price));

    // upsert replaces the expiry of the same (key, type)
    price.expires_at_ms = now + 120'000;
    assert(repo.UpsertCooldown(*tx, price));

    CooldownRecord campaign{.cooldown_key  = key,
                            .type          = COOLDOWN_TYPE_CAMPAIGN_TRIGGER,
                            .campaign_id   = "c1",
                            .expires_at_ms = now + 60'000,
                            .updated_at_ms = now};
    assert(repo.UpsertCooldown(*tx, campaign));
    tx->Commit();
  }
  {
    auto tx     = repo.Begin();
    auto stored = repo.GetCooldown(*tx, key, COOLDOWN_TYPE_PRICE_UPDATE);
    assert(stored.has_value());
    assert(stored->expires_at_ms == now + 120'000);

    auto listed = repo.ListCooldowns(*tx, key);
    assert(listed.size() == 2);
    assert(listed[0].type == COOLDOWN_TYPE_PRICE_UPDATE);
    assert(listed[1].campaign_id == "c1");

    assert(repo.DeleteCooldown(*tx, key, COOLDOWN_TYPE_CAMPAIGN_TRIGGER));
    auto missing = repo.DeleteCooldown(*tx, key, COOLDOWN_TYPE_CAMPAIGN_TRIGGER);
    assert(!missing && missing.code == ErrorCode::NotFound);

    uint64_t removed = 0;
    assert(repo.DeleteExpiredCooldowns(*tx, now + 200'000, &removed));
    assert(removed >= 1);
    assert(!repo.GetCooldown(*tx, key, COOLDOWN_TYPE_PRICE_UPDATE).has_value());
    tx->Commit();
  }
}

void VerifyRuleStates(Repository& repo, const std::string& variant_id) {
  {
    auto            tx = repo.Begin();
    RuleStateRecord state;
    state.campaign_id     = "c1";
    state.rule_id         = "r1";
    state.variant_id      = variant_id;
    state.state           = RULE_STATE_INACTIVE;
    state.last_inventory  = 15;
    state.last_price      = 20.0;
    state.updated_at_ms   = NowMs();
    assert(repo.UpsertRuleState(*tx, state));

    state.state           = RULE_STATE_TRIGGERED;
    state.last_inventory  = 8;
    state.trigger_count   = 1;
    state.triggered_at_ms = NowMs();
    assert(repo.UpsertRuleState(*tx, state));

    state.rule_id = "r2";
    state.state   = RULE_STATE_RESET_PENDING;
    assert(repo.UpsertRuleState(*tx, state));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetRuleState(*tx, "c1", "r1", variant_id);
  assert(stored.has_value());
  assert(stored->state == RULE_STATE_TRIGGERED);
  assert(stored->last_inventory == 8);
  assert(stored->trigger_count == 1);
  assert(stored->cooldown_until_ms == 0);

  auto all = repo.ListRuleStates(*tx, variant_id);
  assert(all.size() == 2);
  assert(all[0].rule_id == "r1");
  assert(all[1].state == RULE_STATE_RESET_PENDING);

  assert(!repo.GetRuleState(*tx, "c1", "missing", variant_id).has_value());
  tx->Commit();
}

void VerifyVariantHistoryAndAudit(Repository& repo, const std::string& variant_id) {
  {
    auto                  tx = repo.Begin();
    VariantSnapshotRecord first{.variant_id         = variant_id,
                                .product_id         = "gid://shopify/Product/1",
                                .inventory_quantity = 15,
                                .price              = 20.0,
                                .compare_at_price   = std::nullopt,
                                .inventory_change   = 0,
                                .price_change       = 0.0,
                                .reason             = "webhook_update",
                                .captured_at_ms     = NowMs()};
    assert(repo.InsertVariantSnapshot(*tx, first));

    auto second               = first;
    second.inventory_quantity = 8;
    second.inventory_change   = -7;
    second.compare_at_price   = 30.0;
    assert(repo.InsertVariantSnapshot(*tx, second));

    AuditRecord audit;
    audit.id                = variant_id + "-audit-1";
    audit.shop              = "demo.myshopify.com";
    audit.entity_type       = "variant";
    audit.entity_id         = variant_id;
    audit.product_id        = "gid://shopify/Product/1";
    audit.change_type       = "price_update";
    audit.old_value         = "20.00";
    audit.new_value         = "25.00";
    audit.trigger_reason    = "Threshold crossed: 15 -> 8 (less_than 10)";
    audit.campaign_id       = variant_id + "-c1";
    audit.source_message_id = "m2";
    audit.created_at_ms     = NowMs();
    assert(repo.InsertAuditEntry(*tx, audit));

    audit.id          = variant_id + "-audit-2";
    audit.change_type = "compare_at_update";
    assert(repo.InsertAuditEntry(*tx, audit));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto latest = repo.GetLatestVariantSnapshot(*tx, variant_id);
  assert(latest.has_value());
  assert(latest->inventory_quantity == 8);
  assert(latest->inventory_change == -7);
  assert(latest->compare_at_price && *latest->compare_at_price == 30.0);
  assert(!repo.GetLatestVariantSnapshot(*tx, variant_id + "-none").has_value());

  auto audit = repo.ListAuditEntries(*tx, variant_id);
  assert(audit.size() == 2);
  assert(audit[0].change_type == "price_update");
  assert(audit[0].new_value == "25.00");
  assert(audit[1].change_type == "compare_at_update");

  auto by_campaign = repo.ListCampaignAuditEntries(*tx, variant_id + "-c1");
  assert(by_campaign.size() == 2);
  assert(by_campaign[0].id == variant_id + "-audit-1");
  assert(by_campaign[1].entity_id == variant_id);
  assert(repo.ListCampaignAuditEntries(*tx, variant_id + "-c2").empty());
  tx->Commit();
}

void VerifyCampaigns(Repository& repo, const std::string& shop) {
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 3; ++i) {
      CampaignRecord record;
      record.id              = shop + "-c" + std::to_string(i);
      record.shop            = shop;
      record.status          = i == 1 ? CAMPAIGN_STATUS_PAUSED : CAMPAIGN_STATUS_ACTIVE;
      record.priority        = 10 - i;
      record.definition_json = "{\"name\":\"campaign " + std::to_string(i) + "\"}";
      record.updated_at_ms   = NowMs();
      assert(repo.UpsertCampaign(*tx, record));
    }
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto active = repo.ListCampaigns(*tx, shop, CAMPAIGN_STATUS_ACTIVE);
  assert(active.size() == 2);
  assert(active[0].id == shop + "-c2");
  assert(active[1].id == shop + "-c0");

  const auto triggered_at = NowMs();
  assert(repo.IncrementCampaignTriggerCount(*tx, shop + "-c0", triggered_at));
  assert(repo.IncrementCampaignTriggerCount(*tx, shop + "-c0", triggered_at));
  auto missing = repo.IncrementCampaignTriggerCount(*tx, shop + "-none", triggered_at);
  assert(!missing && missing.code == ErrorCode::NotFound);

  auto c0 = repo.GetCampaign(*tx, shop + "-c0");
  assert(c0.has_value());
  assert(c0->trigger_count == 2);
  assert(c0->last_triggered_at_ms == triggered_at);
  assert(c0->definition_json == "{\"name\":\"campaign 0\"}");
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& key) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertLock(*tx, MakeLock(key, "owner-a", NowMs() + 60'000)));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetLock(*tx, key).has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& key) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo    = backend.make_repository();
  const auto expires = NowMs() + 600'000;
  {
    auto tx = repo->Begin();
    assert(repo->UpsertCooldown(
        *tx, CooldownRecord{.cooldown_key = key, .type = COOLDOWN_TYPE_PRICE_UPDATE, .campaign_id = "", .expires_at_ms = expires, .updated_at_ms = NowMs()}));

    RuleStateRecord state;
    state.campaign_id   = "c1";
    state.rule_id       = "r1";
    state.variant_id    = key;
    state.state         = RULE_STATE_TRIGGERED;
    state.trigger_count = 3;
    state.updated_at_ms = NowMs();
    assert(repo->UpsertRuleState(*tx, state));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx       = repo->Begin();
  auto cooldown = repo->GetCooldown(*tx, key, COOLDOWN_TYPE_PRICE_UPDATE);
  assert(cooldown.has_value());
  assert(cooldown->expires_at_ms == expires);

  auto state = repo->GetRuleState(*tx, "c1", "r1", key);
  assert(state.has_value());
  assert(state->trigger_count == 3);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if REPRICER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("repricer_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<repricer::db::sqlite::SqliteDB>(db_path);
    repricer::db::sql::RunMigrations(*db, repricer::db::sql::SqliteSchema());
    return std::make_shared<repricer::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if REPRICER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("REPRICER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("REPRICER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    repricer::db::postgres::BootstrapSchema(conninfo);
    return std::make_shared<repricer::db::postgres::PgRepository>(std::make_shared<repricer::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // rows persist across postgres runs
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyLockLifecycle(*repo, run + "-lock");
  VerifyLockRace(*repo, run + "-race");
  VerifyCooldowns(*repo, run + "-cooldown");
  VerifyRuleStates(*repo, run + "-variant");
  VerifyVariantHistoryAndAudit(*repo, run + "-history");
  VerifyCampaigns(*repo, run + ".myshopify.com");
  VerifyRollbackBehavior(*repo, run + "-rollback");

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if REPRICER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if REPRICER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repricer_integration_repository_parity: pass\n";
  return 0;
}
