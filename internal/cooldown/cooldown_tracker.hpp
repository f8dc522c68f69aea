#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "repricer/engine/v1/state.pb.h"

namespace repricer::cooldown {

/*
  Store-backed suppression windows keyed by (key, type).

  Expiry is lazy: a row with expires_at <= now reads as absent and is
  only physically removed by CleanupExpired. A store failure while
  checking never blocks processing.
*/
class CooldownTracker {
 public:
  explicit CooldownTracker(std::shared_ptr<db::Repository> repository, util::ClockFn clock = util::Now);

  bool IsSuppressed(const std::string& key, repricer::engine::v1::CooldownType type);

  // Upsert; extends or shortens an existing window. Throws StoreUnavailable.
  void Set(const std::string& key, repricer::engine::v1::CooldownType type, std::chrono::milliseconds ttl, const std::string& campaign_id = {});

  // Returns false when nothing was stored under (key, type).
  bool Clear(const std::string& key, repricer::engine::v1::CooldownType type);

  // Empty key lists every cooldown.
  std::vector<repricer::engine::v1::CooldownEntry> List(const std::string& key, bool include_expired);

  uint64_t CleanupExpired();

  static std::string CampaignKey(const std::string& campaign_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

/*
  Pre-emptive cooldown taken before a mutation attempt.

  Set on construction; deleted on destruction unless Commit() was
  called, so concurrent evaluators are held off while the attempt is in
  flight and the variant is left unsuppressed when nothing changed.
*/
class CooldownReservation {
 public:
  CooldownReservation(CooldownTracker& tracker, std::string key, repricer::engine::v1::CooldownType type, std::chrono::milliseconds ttl);
  ~CooldownReservation();

  CooldownReservation(const CooldownReservation&)            = delete;
  CooldownReservation& operator=(const CooldownReservation&) = delete;

  void Commit() {
    committed_ = true;
  }

  bool Committed() const {
    return committed_;
  }

 private:
  CooldownTracker&                   tracker_;
  std::string                        key_;
  repricer::engine::v1::CooldownType type_;
  bool                               committed_ = false;
};

} // namespace repricer::cooldown
