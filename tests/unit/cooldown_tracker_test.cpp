#include "internal/cooldown/cooldown_tracker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "test_support.hpp"

namespace {

using repricer::cooldown::CooldownReservation;
using repricer::cooldown::CooldownTracker;
using repricer::db::memory::MemoryRepository;
using repricer::engine::v1::COOLDOWN_TYPE_CAMPAIGN_TRIGGER;
using repricer::engine::v1::COOLDOWN_TYPE_PRICE_UPDATE;
using repricer::testing::ManualClock;

void TestSuppressesUntilExpiry() {
  auto            repo = std::make_shared<MemoryRepository>();
  ManualClock     clock;
  CooldownTracker tracker(repo, clock.Fn());

  assert(!tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
  tracker.Set("v1", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(120));
  assert(tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
  assert(!tracker.IsSuppressed("v1", COOLDOWN_TYPE_CAMPAIGN_TRIGGER));

  clock.Advance(std::chrono::seconds(119));
  assert(tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
  clock.Advance(std::chrono::seconds(1));
  assert(!tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
}

void TestSetIsAnUpsert() {
  auto            repo = std::make_shared<MemoryRepository>();
  ManualClock     clock;
  CooldownTracker tracker(repo, clock.Fn());

  tracker.Set("v1", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(10));
  tracker.Set("v1", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(300));

  const auto entries = tracker.List("v1", true);
  assert(entries.size() == 1);
  assert(entries[0].seconds_remaining() == 300);

  clock.Advance(std::chrono::seconds(30));
  assert(tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
}

void TestClearAndList() {
  auto            repo = std::make_shared<MemoryRepository>();
  ManualClock     clock;
  CooldownTracker tracker(repo, clock.Fn());

  const auto campaign_key = CooldownTracker::CampaignKey("c1");
  assert(campaign_key == "campaign_c1");

  tracker.Set("v1", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(120));
  tracker.Set(campaign_key, COOLDOWN_TYPE_CAMPAIGN_TRIGGER, std::chrono::seconds(60), "c1");
  tracker.Set("v2", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(1));

  clock.Advance(std::chrono::seconds(2));
  assert(tracker.List("", false).size() == 2);
  assert(tracker.List("", true).size() == 3);

  const auto campaign = tracker.List(campaign_key, false);
  assert(campaign.size() == 1);
  assert(campaign[0].campaign_id() == "c1");
  assert(campaign[0].type() == COOLDOWN_TYPE_CAMPAIGN_TRIGGER);
  assert(!campaign[0].expired());

  assert(tracker.Clear("v1", COOLDOWN_TYPE_PRICE_UPDATE));
  assert(!tracker.Clear("v1", COOLDOWN_TYPE_PRICE_UPDATE));
  assert(!tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));

  assert(tracker.CleanupExpired() == 1);
  assert(tracker.List("", true).size() == 1);
}

void TestReservationRollsBackUnlessCommitted() {
  auto            repo = std::make_shared<MemoryRepository>();
  ManualClock     clock;
  CooldownTracker tracker(repo, clock.Fn());

  {
    CooldownReservation reservation(tracker, "v1", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(120));
    assert(tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
  }
  assert(!tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));

  {
    CooldownReservation reservation(tracker, "v1", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(120));
    reservation.Commit();
    assert(reservation.Committed());
  }
  assert(tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
}

void TestReservationRollsBackOnException() {
  auto            repo = std::make_shared<MemoryRepository>();
  ManualClock     clock;
  CooldownTracker tracker(repo, clock.Fn());

  bool thrown = false;
  try {
    CooldownReservation reservation(tracker, "v1", COOLDOWN_TYPE_PRICE_UPDATE, std::chrono::seconds(120));
    throw std::runtime_error("mutation failed");
  } catch (const std::runtime_error&) {
    thrown = true;
  }
  assert(thrown);
  assert(!tracker.IsSuppressed("v1", COOLDOWN_TYPE_PRICE_UPDATE));
}

} // namespace

int main() {
  TestSuppressesUntilExpiry();
  TestSetIsAnUpsert();
  TestClearAndList();
  TestReservationRollsBackUnlessCommitted();
  TestReservationRollsBackOnException();

  std::cout << "repricer_unit_cooldown_tracker: pass\n";
  return 0;
}
