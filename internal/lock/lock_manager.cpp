#include "internal/lock/lock_manager.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace repricer::lock {

using repricer::db::ErrorCode;
using repricer::engine::v1::LockType;
using repricer::observability::StringField;

ScopedLock::ScopedLock(LockManager* manager, std::string key, std::string holder)
    : manager_(manager), key_(std::move(key)), holder_(std::move(holder)) {
}

ScopedLock::~ScopedLock() {
  Release();
}

ScopedLock::ScopedLock(ScopedLock&& other) noexcept
    : manager_(std::exchange(other.manager_, nullptr)), key_(std::move(other.key_)), holder_(std::move(other.holder_)) {
}

ScopedLock& ScopedLock::operator=(ScopedLock&& other) noexcept {
  if (this != &other) {
    Release();
    manager_ = std::exchange(other.manager_, nullptr);
    key_     = std::move(other.key_);
    holder_  = std::move(other.holder_);
  }
  return *this;
}

void ScopedLock::Release() {
  if (manager_ == nullptr) {
    return;
  }
  std::exchange(manager_, nullptr)->Release(key_, holder_);
}

LockManager::LockManager(std::shared_ptr<db::Repository> repository, std::string owner, util::ClockFn clock)
    : repository_(std::move(repository)), owner_(std::move(owner)), clock_(std::move(clock)) {
}

std::string LockManager::WebhookKey(const std::string& message_id) {
  return "webhook_" + message_id;
}

std::string LockManager::VariantKey(const std::string& variant_id) {
  return "variant_processing_" + variant_id;
}

std::optional<std::string> LockManager::TryAcquire(const std::string& key, LockType type, std::chrono::milliseconds ttl) {
  const auto now_ms = util::ToUnixMillis(clock_());

  db::model::LockRecord record;
  record.lock_key      = key;
  record.type          = type;
  record.owner         = owner_ + ":" + util::GenerateId("lock");
  record.created_at_ms = now_ms;
  record.expires_at_ms = now_ms + static_cast<uint64_t>(ttl.count());

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertLock(*tx, record);

    if (!result && result.code == ErrorCode::AlreadyExists) {
      result = repository_->ReclaimExpiredLock(*tx, record, now_ms);
      if (result) {
        REPRICER_LOG_INFO("reclaimed expired lock", {StringField("key", key), StringField("holder", record.owner)});
      }
    }

    if (!result) {
      if (result.code == ErrorCode::Conflict || result.code == ErrorCode::NotFound) {
        repricer::observability::Metrics::Instance().RecordLockContention(repricer::engine::v1::LockType_Name(type));
      } else {
        REPRICER_LOG_WARN("lock acquisition failed", {StringField("key", key), StringField("code", db::ToString(result.code)),
                                                      StringField("error", result.message)});
      }
      return std::nullopt;
    }

    tx->Commit();
    return record.owner;
  } catch (const std::exception& e) {
    REPRICER_LOG_WARN("lock acquisition failed", {StringField("key", key), StringField("error", e.what())});
    return std::nullopt;
  }
}

ScopedLock LockManager::Acquire(const std::string& key, LockType type, std::chrono::milliseconds ttl) {
  auto holder = TryAcquire(key, type, ttl);
  if (!holder) {
    return {};
  }
  return ScopedLock(this, key, std::move(*holder));
}

void LockManager::Release(const std::string& key, const std::string& holder) {
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->DeleteLock(*tx, key, holder);
    if (!result) {
      if (result.code == ErrorCode::NotFound) {
        REPRICER_LOG_DEBUG("lock already gone at release", {StringField("key", key), StringField("holder", holder)});
      } else {
        REPRICER_LOG_WARN("lock release failed", {StringField("key", key), StringField("error", result.message)});
      }
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    REPRICER_LOG_WARN("lock release failed", {StringField("key", key), StringField("error", e.what())});
  }
}

uint64_t LockManager::CleanupExpired() {
  uint64_t removed = 0;
  auto     tx      = repository_->Begin();
  db::ThrowIfError(repository_->DeleteExpiredLocks(*tx, util::ToUnixMillis(clock_()), &removed), "cleanup expired locks");
  tx->Commit();
  return removed;
}

} // namespace repricer::lock
