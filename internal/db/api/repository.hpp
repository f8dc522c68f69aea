#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/campaign_record.hpp"
#include "internal/db/model/cooldown_record.hpp"
#include "internal/db/model/lock_record.hpp"
#include "internal/db/model/rule_state_record.hpp"
#include "internal/db/model/variant_snapshot_record.hpp"

namespace repricer::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertLock is create-or-fail on lock_key (AlreadyExists when taken)
  - ReclaimExpiredLock only succeeds while the stored row is expired
    (Conflict otherwise)
  - UpsertCooldown / UpsertRuleState are atomic upserts on their keys

  The store is the only synchronization point between processing
  instances. Nothing above this layer may keep lock or cooldown state
  in process memory.

  Read methods throw on backend failure; callers that can degrade
  (rule state lookups) catch and say so explicitly.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Processing locks
  // ---------------------------------------------------------------------

  virtual Result InsertLock(Transaction&, const model::LockRecord&) = 0;

  virtual std::optional<model::LockRecord> GetLock(Transaction&, const std::string& lock_key) = 0;

  // Replaces owner/type/expiry of `lock_key` when its current expiry is <= now_ms.
  virtual Result ReclaimExpiredLock(Transaction&, const model::LockRecord&, uint64_t now_ms) = 0;

  // Owner-checked delete. NotFound when the key is absent or held under another token.
  virtual Result DeleteLock(Transaction&, const std::string& lock_key, const std::string& owner) = 0;

  virtual Result DeleteExpiredLocks(Transaction&, uint64_t now_ms, uint64_t* removed) = 0;

  // ---------------------------------------------------------------------
  // Cooldowns
  // ---------------------------------------------------------------------

  virtual Result UpsertCooldown(Transaction&, const model::CooldownRecord&) = 0;

  virtual std::optional<model::CooldownRecord> GetCooldown(Transaction&, const std::string& cooldown_key,
                                                           repricer::engine::v1::CooldownType type) = 0;

  virtual Result DeleteCooldown(Transaction&, const std::string& cooldown_key, repricer::engine::v1::CooldownType type) = 0;

  // Empty key lists every cooldown.
  virtual std::vector<model::CooldownRecord> ListCooldowns(Transaction&, const std::string& cooldown_key) = 0;

  virtual Result DeleteExpiredCooldowns(Transaction&, uint64_t now_ms, uint64_t* removed) = 0;

  // ---------------------------------------------------------------------
  // Rule execution state
  // ---------------------------------------------------------------------

  virtual std::optional<model::RuleStateRecord> GetRuleState(Transaction&, const std::string& campaign_id, const std::string& rule_id,
                                                             const std::string& variant_id) = 0;

  virtual Result UpsertRuleState(Transaction&, const model::RuleStateRecord&) = 0;

  virtual std::vector<model::RuleStateRecord> ListRuleStates(Transaction&, const std::string& variant_id) = 0;

  // ---------------------------------------------------------------------
  // Variant state history
  // ---------------------------------------------------------------------

  virtual Result InsertVariantSnapshot(Transaction&, const model::VariantSnapshotRecord&) = 0;

  virtual std::optional<model::VariantSnapshotRecord> GetLatestVariantSnapshot(Transaction&, const std::string& variant_id) = 0;

  // ---------------------------------------------------------------------
  // Audit trail
  // ---------------------------------------------------------------------

  virtual Result InsertAuditEntry(Transaction&, const model::AuditRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::AuditRecord> ListAuditEntries(Transaction&, const std::string& entity_id) = 0;

  // Every entry written for a campaign, across variants. Oldest first.
  virtual std::vector<model::AuditRecord> ListCampaignAuditEntries(Transaction&, const std::string& campaign_id) = 0;

  // ---------------------------------------------------------------------
  // Campaigns
  // ---------------------------------------------------------------------

  virtual Result UpsertCampaign(Transaction&, const model::CampaignRecord&) = 0;

  virtual std::optional<model::CampaignRecord> GetCampaign(Transaction&, const std::string& id) = 0;

  // Ordered by (priority, id).
  virtual std::vector<model::CampaignRecord> ListCampaigns(Transaction&, const std::string& shop, repricer::engine::v1::CampaignStatus status) = 0;

  virtual Result IncrementCampaignTriggerCount(Transaction&, const std::string& id, uint64_t triggered_at_ms) = 0;
};

} // namespace repricer::db
