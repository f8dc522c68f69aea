#include "internal/lock/lock_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "test_support.hpp"

namespace {

using repricer::db::memory::MemoryRepository;
using repricer::engine::v1::LOCK_TYPE_CAMPAIGN_EXECUTION;
using repricer::engine::v1::LOCK_TYPE_WEBHOOK_PROCESSING;
using repricer::lock::LockManager;
using repricer::testing::ManualClock;

constexpr std::chrono::milliseconds kTtl = std::chrono::seconds(60);

std::optional<repricer::db::model::LockRecord> StoredLock(repricer::db::Repository& repo, const std::string& key) {
  auto tx   = repo.Begin();
  auto lock = repo.GetLock(*tx, key);
  tx->Commit();
  return lock;
}

void TestSecondOwnerIsRejectedWhileHeld() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  LockManager a(repo, "owner-a", clock.Fn());
  LockManager b(repo, "owner-b", clock.Fn());

  const auto holder = a.TryAcquire("webhook_m1", LOCK_TYPE_WEBHOOK_PROCESSING, kTtl);
  assert(holder.has_value());
  assert(holder->rfind(a.Owner() + ":lock-", 0) == 0);
  assert(StoredLock(*repo, "webhook_m1")->owner == *holder);
  assert(!b.TryAcquire("webhook_m1", LOCK_TYPE_WEBHOOK_PROCESSING, kTtl).has_value());
  assert(!a.TryAcquire("webhook_m1", LOCK_TYPE_WEBHOOK_PROCESSING, kTtl).has_value());

  a.Release("webhook_m1", *holder);
  assert(!StoredLock(*repo, "webhook_m1").has_value());
  assert(b.TryAcquire("webhook_m1", LOCK_TYPE_WEBHOOK_PROCESSING, kTtl).has_value());
  assert(StoredLock(*repo, "webhook_m1")->owner.rfind("owner-b:", 0) == 0);
}

void TestExpiredLockIsReclaimedAndStaleReleaseIsIgnored() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  LockManager stale(repo, "owner-stale", clock.Fn());
  LockManager fresh(repo, "owner-fresh", clock.Fn());

  const auto stale_holder = stale.TryAcquire("variant_processing_v1", LOCK_TYPE_CAMPAIGN_EXECUTION, kTtl);
  assert(stale_holder.has_value());

  clock.Advance(std::chrono::seconds(59));
  assert(!fresh.TryAcquire("variant_processing_v1", LOCK_TYPE_CAMPAIGN_EXECUTION, kTtl).has_value());

  clock.Advance(std::chrono::seconds(2));
  const auto fresh_holder = fresh.TryAcquire("variant_processing_v1", LOCK_TYPE_CAMPAIGN_EXECUTION, kTtl);
  assert(fresh_holder.has_value());

  stale.Release("variant_processing_v1", *stale_holder);
  const auto held = StoredLock(*repo, "variant_processing_v1");
  assert(held.has_value());
  assert(held->owner == *fresh_holder);
  assert(held->expires_at_ms == repricer::util::ToUnixMillis(clock.Now()) + static_cast<uint64_t>(kTtl.count()));
}

void TestStaleScopedLockKeepsReclaimedLockOfSameManager() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  LockManager manager(repo, "owner-a", clock.Fn());
  const auto  key = LockManager::VariantKey("v7");

  auto first = manager.Acquire(key, LOCK_TYPE_CAMPAIGN_EXECUTION, kTtl);
  assert(first);

  clock.Advance(kTtl + std::chrono::seconds(1));
  auto second = manager.Acquire(key, LOCK_TYPE_CAMPAIGN_EXECUTION, kTtl);
  assert(second);
  assert(second.Holder() != first.Holder());

  first.Release();
  assert(!first);
  const auto held = StoredLock(*repo, key);
  assert(held.has_value());
  assert(held->owner == second.Holder());
  assert(!manager.TryAcquire(key, LOCK_TYPE_CAMPAIGN_EXECUTION, kTtl).has_value());

  second.Release();
  assert(!StoredLock(*repo, key).has_value());
}

void TestScopedLockReleasesOnScopeExitAndMove() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  LockManager manager(repo, "owner-a", clock.Fn());

  {
    auto guard = manager.Acquire(LockManager::WebhookKey("m2"), LOCK_TYPE_WEBHOOK_PROCESSING, kTtl);
    assert(guard);
    assert(guard.Key() == "webhook_m2");

    auto moved = std::move(guard);
    assert(moved);
    assert(!guard);
    assert(StoredLock(*repo, "webhook_m2").has_value());
  }
  assert(!StoredLock(*repo, "webhook_m2").has_value());

  LockManager other(repo, "owner-b", clock.Fn());
  auto        held   = manager.Acquire("k", LOCK_TYPE_WEBHOOK_PROCESSING, kTtl);
  auto        denied = other.Acquire("k", LOCK_TYPE_WEBHOOK_PROCESSING, kTtl);
  assert(held);
  assert(!denied);
}

void TestCleanupRemovesOnlyExpiredLocks() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  LockManager manager(repo, "owner-a", clock.Fn());

  assert(manager.TryAcquire("short", LOCK_TYPE_WEBHOOK_PROCESSING, std::chrono::seconds(1)).has_value());
  assert(manager.TryAcquire("long", LOCK_TYPE_WEBHOOK_PROCESSING, std::chrono::seconds(600)).has_value());

  clock.Advance(std::chrono::seconds(5));
  assert(manager.CleanupExpired() == 1);
  assert(!StoredLock(*repo, "short").has_value());
  assert(StoredLock(*repo, "long").has_value());
}

void TestKeyFormats() {
  assert(LockManager::WebhookKey("abc") == "webhook_abc");
  assert(LockManager::VariantKey("gid://shopify/ProductVariant/1") == "variant_processing_gid://shopify/ProductVariant/1");
}

} // namespace

int main() {
  TestSecondOwnerIsRejectedWhileHeld();
  TestExpiredLockIsReclaimedAndStaleReleaseIsIgnored();
  TestStaleScopedLockKeepsReclaimedLockOfSameManager();
  TestScopedLockReleasesOnScopeExitAndMove();
  TestCleanupRemovesOnlyExpiredLocks();
  TestKeyFormats();

  std::cout << "repricer_unit_lock_manager: pass\n";
  return 0;
}
