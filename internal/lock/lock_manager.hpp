#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "repricer/engine/v1/state.pb.h"

namespace repricer::lock {

class LockManager;

/*
  RAII holder for a processing lock.

  Releases on destruction when the acquisition succeeded. Move-only.
  Carries the holder token of its own acquisition, so releasing only
  removes the row this acquisition wrote.
*/
class ScopedLock {
 public:
  ScopedLock() = default;
  ScopedLock(LockManager* manager, std::string key, std::string holder);
  ~ScopedLock();

  ScopedLock(const ScopedLock&)            = delete;
  ScopedLock& operator=(const ScopedLock&) = delete;

  ScopedLock(ScopedLock&& other) noexcept;
  ScopedLock& operator=(ScopedLock&& other) noexcept;

  explicit operator bool() const {
    return manager_ != nullptr;
  }

  const std::string& Key() const {
    return key_;
  }

  const std::string& Holder() const {
    return holder_;
  }

  void Release();

 private:
  LockManager* manager_ = nullptr;
  std::string  key_;
  std::string  holder_;
};

/*
  TTL-based mutual exclusion over named keys, backed by the shared store.

  Acquisition is create-or-fail on the key. An expired holder is
  displaced by a conditional reclaim that only succeeds while the row
  is still expired, so two contenders cannot both win. Losing the race
  is a normal outcome, never an error. Store failures count as
  "not acquired".

  Every acquisition writes its own holder token ("<owner>:lock-<uuid>")
  as the row owner. Release is checked against that token: a holder
  whose lock expired and was reclaimed cannot delete the new holder's
  row, even when both acquisitions come from the same process.
*/
class LockManager {
 public:
  LockManager(std::shared_ptr<db::Repository> repository, std::string owner, util::ClockFn clock = util::Now);

  // Returns the holder token on success, nullopt when the key is held or the store failed.
  std::optional<std::string> TryAcquire(const std::string& key, repricer::engine::v1::LockType type,
                                        std::chrono::milliseconds ttl);

  ScopedLock Acquire(const std::string& key, repricer::engine::v1::LockType type, std::chrono::milliseconds ttl);

  void Release(const std::string& key, const std::string& holder);

  // Removes every lock whose expiry has passed. Returns the number removed.
  uint64_t CleanupExpired();

  const std::string& Owner() const {
    return owner_;
  }

  static std::string WebhookKey(const std::string& message_id);
  static std::string VariantKey(const std::string& variant_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     owner_;
  util::ClockFn                   clock_;
};

} // namespace repricer::lock
