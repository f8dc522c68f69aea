#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace repricer::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
