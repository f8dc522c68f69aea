#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace repricer::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and single-instance deployments.

  Transactions are exclusive: Begin() takes the writer mutex for the
  transaction's lifetime, mirroring SQLite BEGIN IMMEDIATE. A second
  Begin() waits up to busy_timeout and then throws.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

  std::unique_ptr<Transaction> Begin() override;

  Result InsertLock(Transaction&, const model::LockRecord&) override;
  std::optional<model::LockRecord> GetLock(Transaction&, const std::string&) override;
  Result ReclaimExpiredLock(Transaction&, const model::LockRecord&, uint64_t now_ms) override;
  Result DeleteLock(Transaction&, const std::string& lock_key, const std::string& owner) override;
  Result DeleteExpiredLocks(Transaction&, uint64_t now_ms, uint64_t* removed) override;

  Result UpsertCooldown(Transaction&, const model::CooldownRecord&) override;
  std::optional<model::CooldownRecord> GetCooldown(Transaction&, const std::string&, repricer::engine::v1::CooldownType) override;
  Result DeleteCooldown(Transaction&, const std::string&, repricer::engine::v1::CooldownType) override;
  std::vector<model::CooldownRecord> ListCooldowns(Transaction&, const std::string&) override;
  Result DeleteExpiredCooldowns(Transaction&, uint64_t now_ms, uint64_t* removed) override;

  std::optional<model::RuleStateRecord> GetRuleState(Transaction&, const std::string& campaign_id, const std::string& rule_id,
                                                     const std::string& variant_id) override;
  Result UpsertRuleState(Transaction&, const model::RuleStateRecord&) override;
  std::vector<model::RuleStateRecord> ListRuleStates(Transaction&, const std::string& variant_id) override;

  Result InsertVariantSnapshot(Transaction&, const model::VariantSnapshotRecord&) override;
  std::optional<model::VariantSnapshotRecord> GetLatestVariantSnapshot(Transaction&, const std::string& variant_id) override;

  Result InsertAuditEntry(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAuditEntries(Transaction&, const std::string& entity_id) override;
  std::vector<model::AuditRecord> ListCampaignAuditEntries(Transaction&, const std::string& campaign_id) override;

  Result UpsertCampaign(Transaction&, const model::CampaignRecord&) override;
  std::optional<model::CampaignRecord> GetCampaign(Transaction&, const std::string& id) override;
  std::vector<model::CampaignRecord> ListCampaigns(Transaction&, const std::string& shop, repricer::engine::v1::CampaignStatus status) override;
  Result IncrementCampaignTriggerCount(Transaction&, const std::string& id, uint64_t triggered_at_ms) override;

private:
  friend class MemoryTransaction;

  using CooldownKey  = std::pair<std::string, int>;
  using RuleStateKey = std::tuple<std::string, std::string, std::string>;

  struct State {
    std::map<std::string, model::LockRecord>       locks;
    std::map<CooldownKey, model::CooldownRecord>   cooldowns;
    std::map<RuleStateKey, model::RuleStateRecord> rule_states;
    std::vector<model::VariantSnapshotRecord>      variant_history;
    std::vector<model::AuditRecord>                audit;
    std::map<std::string, model::CampaignRecord>   campaigns;
  };

  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          writer_;
  State                     committed_;
};

}
