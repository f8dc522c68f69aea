#include "internal/cooldown/cooldown_tracker.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace repricer::cooldown {

using repricer::db::ErrorCode;
using repricer::engine::v1::CooldownEntry;
using repricer::engine::v1::CooldownType;
using repricer::observability::StringField;

CooldownTracker::CooldownTracker(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

std::string CooldownTracker::CampaignKey(const std::string& campaign_id) {
  return "campaign_" + campaign_id;
}

bool CooldownTracker::IsSuppressed(const std::string& key, CooldownType type) {
  try {
    auto tx     = repository_->Begin();
    auto record = repository_->GetCooldown(*tx, key, type);
    tx->Commit();
    return record.has_value() && record->expires_at_ms > util::ToUnixMillis(clock_());
  } catch (const std::exception& e) {
    REPRICER_LOG_WARN("cooldown check failed; not suppressing",
                      {StringField("key", key), StringField("type", CooldownType_Name(type)), StringField("error", e.what())});
    return false;
  }
}

void CooldownTracker::Set(const std::string& key, CooldownType type, std::chrono::milliseconds ttl, const std::string& campaign_id) {
  const auto now_ms = util::ToUnixMillis(clock_());

  db::model::CooldownRecord record;
  record.cooldown_key  = key;
  record.type          = type;
  record.campaign_id   = campaign_id;
  record.updated_at_ms = now_ms;
  record.expires_at_ms = now_ms + static_cast<uint64_t>(ttl.count());

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertCooldown(*tx, record), "set cooldown " + key);
  tx->Commit();
}

bool CooldownTracker::Clear(const std::string& key, CooldownType type) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteCooldown(*tx, key, type);
  if (!result && result.code == ErrorCode::NotFound) {
    return false;
  }
  db::ThrowIfError(result, "clear cooldown " + key);
  tx->Commit();
  return true;
}

std::vector<CooldownEntry> CooldownTracker::List(const std::string& key, bool include_expired) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListCooldowns(*tx, key);
  tx->Commit();

  const auto                 now_ms = util::ToUnixMillis(clock_());
  std::vector<CooldownEntry> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    const bool expired = record.expires_at_ms <= now_ms;
    if (expired && !include_expired) continue;

    CooldownEntry entry;
    entry.set_key(record.cooldown_key);
    entry.set_type(record.type);
    entry.set_campaign_id(record.campaign_id);
    *entry.mutable_expires_at() = util::ToProto(util::FromUnixMillis(record.expires_at_ms));
    *entry.mutable_updated_at() = util::ToProto(util::FromUnixMillis(record.updated_at_ms));
    entry.set_expired(expired);
    entry.set_seconds_remaining(expired ? 0 : static_cast<int64_t>((record.expires_at_ms - now_ms + 999) / 1000));
    out.push_back(std::move(entry));
  }
  return out;
}

uint64_t CooldownTracker::CleanupExpired() {
  uint64_t removed = 0;
  auto     tx      = repository_->Begin();
  db::ThrowIfError(repository_->DeleteExpiredCooldowns(*tx, util::ToUnixMillis(clock_()), &removed), "cleanup expired cooldowns");
  tx->Commit();
  return removed;
}

CooldownReservation::CooldownReservation(CooldownTracker& tracker, std::string key, CooldownType type, std::chrono::milliseconds ttl)
    : tracker_(tracker), key_(std::move(key)), type_(type) {
  tracker_.Set(key_, type_, ttl);
}

CooldownReservation::~CooldownReservation() {
  if (committed_) {
    return;
  }
  try {
    tracker_.Clear(key_, type_);
  } catch (const std::exception& e) {
    REPRICER_LOG_WARN("cooldown rollback failed", {StringField("key", key_), StringField("error", e.what())});
  }
}

} // namespace repricer::cooldown
