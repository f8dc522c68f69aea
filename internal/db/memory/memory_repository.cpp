#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace repricer::db::memory {

using repricer::engine::v1::CampaignStatus;
using repricer::engine::v1::CooldownType;

MemoryRepository::MemoryRepository(std::chrono::milliseconds busy_timeout) : busy_timeout_(busy_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

Result MemoryRepository::InsertLock(Transaction& t, const model::LockRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.locks.contains(r.lock_key)) return Result::Err(ErrorCode::AlreadyExists, "lock held: " + r.lock_key);
  s.locks[r.lock_key] = r;
  return Result::Ok();
}

std::optional<model::LockRecord> MemoryRepository::GetLock(Transaction& t, const std::string& lock_key) {
  const auto& s  = TX(t).View();
  auto        it = s.locks.find(lock_key);
  if (it == s.locks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::ReclaimExpiredLock(Transaction& t, const model::LockRecord& r, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.locks.find(r.lock_key);
  if (it == s.locks.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.expires_at_ms > now_ms) return Result::Err(ErrorCode::Conflict, "lock still live: " + r.lock_key);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteLock(Transaction& t, const std::string& lock_key, const std::string& owner) {
  auto& s  = TX(t).Mutable();
  auto  it = s.locks.find(lock_key);
  if (it == s.locks.end() || it->second.owner != owner) return Result::Err(ErrorCode::NotFound);
  s.locks.erase(it);
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredLocks(Transaction& t, uint64_t now_ms, uint64_t* removed) {
  auto& s = TX(t).Mutable();
  auto  n = std::erase_if(s.locks, [now_ms](const auto& entry) { return entry.second.expires_at_ms <= now_ms; });
  if (removed) *removed = n;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Cooldowns
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCooldown(Transaction& t, const model::CooldownRecord& r) {
  TX(t).Mutable().cooldowns[{r.cooldown_key, static_cast<int>(r.type)}] = r;
  return Result::Ok();
}

std::optional<model::CooldownRecord> MemoryRepository::GetCooldown(Transaction& t, const std::string& key, CooldownType type) {
  const auto& s  = TX(t).View();
  auto        it = s.cooldowns.find({key, static_cast<int>(type)});
  if (it == s.cooldowns.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteCooldown(Transaction& t, const std::string& key, CooldownType type) {
  auto& s = TX(t).Mutable();
  if (s.cooldowns.erase({key, static_cast<int>(type)}) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::CooldownRecord> MemoryRepository::ListCooldowns(Transaction& t, const std::string& key) {
  std::vector<model::CooldownRecord> out;
  for (const auto& [_, record] : TX(t).View().cooldowns) {
    if (key.empty() || record.cooldown_key == key) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteExpiredCooldowns(Transaction& t, uint64_t now_ms, uint64_t* removed) {
  auto& s = TX(t).Mutable();
  auto  n = std::erase_if(s.cooldowns, [now_ms](const auto& entry) { return entry.second.expires_at_ms <= now_ms; });
  if (removed) *removed = n;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Rule execution state
// ------------------------------------------------------------------

std::optional<model::RuleStateRecord> MemoryRepository::GetRuleState(Transaction& t, const std::string& campaign_id, const std::string& rule_id,
                                                                     const std::string& variant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.rule_states.find({campaign_id, rule_id, variant_id});
  if (it == s.rule_states.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertRuleState(Transaction& t, const model::RuleStateRecord& r) {
  TX(t).Mutable().rule_states[{r.campaign_id, r.rule_id, r.variant_id}] = r;
  return Result::Ok();
}

std::vector<model::RuleStateRecord> MemoryRepository::ListRuleStates(Transaction& t, const std::string& variant_id) {
  std::vector<model::RuleStateRecord> out;
  for (const auto& [_, record] : TX(t).View().rule_states) {
    if (record.variant_id == variant_id) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Variant history
// ------------------------------------------------------------------

Result MemoryRepository::InsertVariantSnapshot(Transaction& t, const model::VariantSnapshotRecord& r) {
  TX(t).Mutable().variant_history.push_back(r);
  return Result::Ok();
}

std::optional<model::VariantSnapshotRecord> MemoryRepository::GetLatestVariantSnapshot(Transaction& t, const std::string& variant_id) {
  const auto& history = TX(t).View().variant_history;
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (it->variant_id == variant_id) return *it;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::InsertAuditEntry(Transaction& t, const model::AuditRecord& r) {
  TX(t).Mutable().audit.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAuditEntries(Transaction& t, const std::string& entity_id) {
  std::vector<model::AuditRecord> out;
  for (const auto& e : TX(t).View().audit)
    if (e.entity_id == entity_id) out.push_back(e);
  return out;
}

std::vector<model::AuditRecord> MemoryRepository::ListCampaignAuditEntries(Transaction& t, const std::string& campaign_id) {
  std::vector<model::AuditRecord> out;
  for (const auto& e : TX(t).View().audit)
    if (e.campaign_id == campaign_id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Campaigns
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCampaign(Transaction& t, const model::CampaignRecord& r) {
  TX(t).Mutable().campaigns[r.id] = r;
  return Result::Ok();
}

std::optional<model::CampaignRecord> MemoryRepository::GetCampaign(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.campaigns.find(id);
  if (it == s.campaigns.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CampaignRecord> MemoryRepository::ListCampaigns(Transaction& t, const std::string& shop, CampaignStatus status) {
  std::vector<model::CampaignRecord> out;
  for (const auto& [_, record] : TX(t).View().campaigns) {
    if (record.shop == shop && record.status == status) out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.priority < b.priority; });
  return out;
}

Result MemoryRepository::IncrementCampaignTriggerCount(Transaction& t, const std::string& id, uint64_t triggered_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.campaigns.find(id);
  if (it == s.campaigns.end()) return Result::Err(ErrorCode::NotFound, "campaign not found: " + id);
  it->second.trigger_count += 1;
  it->second.last_triggered_at_ms = triggered_at_ms;
  return Result::Ok();
}

} // namespace repricer::db::memory
