#include "pg_repository.hpp"

#include "repricer/engine/v1.hpp"

namespace repricer::db::postgres {

using repricer::engine::v1::CampaignStatus;
using repricer::engine::v1::CooldownType;

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

static model::LockRecord ReadLock(const pqxx::row& row) {
  model::LockRecord r;
  r.lock_key      = row[0].c_str();
  r.type          = (repricer::engine::v1::LockType)row[1].as<int>();
  r.owner         = row[2].c_str();
  r.expires_at_ms = row[3].as<uint64_t>();
  r.created_at_ms = row[4].as<uint64_t>();
  return r;
}

Result PgRepository::InsertLock(Transaction& t, const model::LockRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_lock", r.lock_key, (int)r.type, r.owner, r.expires_at_ms, r.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "lock held: " + r.lock_key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LockRecord> PgRepository::GetLock(Transaction& t, const std::string& lock_key) {
  auto res = TX(t).Work().exec_prepared("get_lock", lock_key);
  if (res.empty()) return std::nullopt;
  return ReadLock(res[0]);
}

Result PgRepository::ReclaimExpiredLock(Transaction& t, const model::LockRecord& r, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("reclaim_expired_lock", r.lock_key, (int)r.type, r.owner, r.expires_at_ms, r.created_at_ms, now_ms);
    if (res.affected_rows() > 0) return Result::Ok();

    auto existing = TX(t).Work().exec_prepared("get_lock", r.lock_key);
    if (existing.empty()) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "lock still live: " + r.lock_key);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteLock(Transaction& t, const std::string& lock_key, const std::string& owner) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_lock", lock_key, owner);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredLocks(Transaction& t, uint64_t now_ms, uint64_t* removed) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM processing_locks WHERE expires_at_ms<=$1;", now_ms);
    if (removed) *removed = res.affected_rows();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Cooldowns
// ------------------------------------------------------------------

static model::CooldownRecord ReadCooldown(const pqxx::row& row) {
  model::CooldownRecord r;
  r.cooldown_key  = row[0].c_str();
  r.type          = (CooldownType)row[1].as<int>();
  r.campaign_id   = row[2].c_str();
  r.expires_at_ms = row[3].as<uint64_t>();
  r.updated_at_ms = row[4].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertCooldown(Transaction& t, const model::CooldownRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_cooldown", r.cooldown_key, (int)r.type, r.campaign_id, r.expires_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CooldownRecord> PgRepository::GetCooldown(Transaction& t, const std::string& key, CooldownType type) {
  auto res = TX(t).Work().exec_prepared("get_cooldown", key, (int)type);
  if (res.empty()) return std::nullopt;
  return ReadCooldown(res[0]);
}

Result PgRepository::DeleteCooldown(Transaction& t, const std::string& key, CooldownType type) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM price_cooldowns WHERE cooldown_key=$1 AND cooldown_type=$2;", key, (int)type);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CooldownRecord> PgRepository::ListCooldowns(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_params(
      "SELECT cooldown_key,cooldown_type,campaign_id,expires_at_ms,updated_at_ms FROM price_cooldowns "
      "WHERE ($1='' OR cooldown_key=$1) ORDER BY cooldown_key ASC, cooldown_type ASC;",
      key);

  std::vector<model::CooldownRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCooldown(row));
  return out;
}

Result PgRepository::DeleteExpiredCooldowns(Transaction& t, uint64_t now_ms, uint64_t* removed) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM price_cooldowns WHERE expires_at_ms<=$1;", now_ms);
    if (removed) *removed = res.affected_rows();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Rule execution state
// ------------------------------------------------------------------

static model::RuleStateRecord ReadRuleState(const pqxx::row& row) {
  model::RuleStateRecord r;
  r.campaign_id       = row[0].c_str();
  r.rule_id           = row[1].c_str();
  r.variant_id        = row[2].c_str();
  r.state             = (repricer::engine::v1::RuleState)row[3].as<int>();
  r.last_inventory    = row[4].as<int64_t>();
  r.last_price        = row[5].as<double>();
  r.trigger_count     = row[6].as<uint64_t>();
  r.triggered_at_ms   = row[7].as<uint64_t>();
  r.cooldown_until_ms = row[8].as<uint64_t>();
  r.updated_at_ms     = row[9].as<uint64_t>();
  return r;
}

std::optional<model::RuleStateRecord> PgRepository::GetRuleState(Transaction& t, const std::string& campaign_id, const std::string& rule_id,
                                                                 const std::string& variant_id) {
  auto res = TX(t).Work().exec_prepared("get_rule_state", campaign_id, rule_id, variant_id);
  if (res.empty()) return std::nullopt;
  return ReadRuleState(res[0]);
}

Result PgRepository::UpsertRuleState(Transaction& t, const model::RuleStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_rule_state", r.campaign_id, r.rule_id, r.variant_id, (int)r.state, r.last_inventory, r.last_price,
                               r.trigger_count, r.triggered_at_ms, r.cooldown_until_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RuleStateRecord> PgRepository::ListRuleStates(Transaction& t, const std::string& variant_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT campaign_id,rule_id,variant_id,state,last_inventory,last_price,trigger_count,triggered_at_ms,cooldown_until_ms,updated_at_ms "
      "FROM rule_execution_states WHERE variant_id=$1 ORDER BY campaign_id ASC, rule_id ASC;",
      variant_id);

  std::vector<model::RuleStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadRuleState(row));
  return out;
}

// ------------------------------------------------------------------
// Variant history
// ------------------------------------------------------------------

Result PgRepository::InsertVariantSnapshot(Transaction& t, const model::VariantSnapshotRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO variant_state_history(variant_id,product_id,inventory_quantity,price,compare_at_price,inventory_change,"
        "price_change,reason,captured_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
        r.variant_id, r.product_id, r.inventory_quantity, r.price, r.compare_at_price, r.inventory_change, r.price_change, r.reason,
        r.captured_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::VariantSnapshotRecord> PgRepository::GetLatestVariantSnapshot(Transaction& t, const std::string& variant_id) {
  auto res = TX(t).Work().exec_prepared("get_latest_variant_snapshot", variant_id);
  if (res.empty()) return std::nullopt;

  const auto&                  row = res[0];
  model::VariantSnapshotRecord r;
  r.variant_id         = row[0].c_str();
  r.product_id         = row[1].c_str();
  r.inventory_quantity = row[2].as<int64_t>();
  r.price              = row[3].as<double>();
  if (!row[4].is_null()) r.compare_at_price = row[4].as<double>();
  r.inventory_change = row[5].as<int64_t>();
  r.price_change     = row[6].as<double>();
  r.reason           = row[7].c_str();
  r.captured_at_ms   = row[8].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::InsertAuditEntry(Transaction& t, const model::AuditRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO audit_trail(id,shop,entity_type,entity_id,product_id,change_type,old_value,new_value,trigger_reason,"
        "campaign_id,source_message_id,error,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13);",
        r.id, r.shop, r.entity_type, r.entity_id, r.product_id, r.change_type, r.old_value, r.new_value, r.trigger_reason, r.campaign_id,
        r.source_message_id, r.error, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

namespace {

std::vector<model::AuditRecord> ReadAuditRows(const pqxx::result& res) {
  std::vector<model::AuditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::AuditRecord r;
    r.id                = row[0].c_str();
    r.shop              = row[1].c_str();
    r.entity_type       = row[2].c_str();
    r.entity_id         = row[3].c_str();
    r.product_id        = row[4].c_str();
    r.change_type       = row[5].c_str();
    r.old_value         = row[6].c_str();
    r.new_value         = row[7].c_str();
    r.trigger_reason    = row[8].c_str();
    r.campaign_id       = row[9].c_str();
    r.source_message_id = row[10].c_str();
    r.error             = row[11].is_null() ? "" : row[11].c_str();
    r.created_at_ms     = row[12].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace

std::vector<model::AuditRecord> PgRepository::ListAuditEntries(Transaction& t, const std::string& entity_id) {
  return ReadAuditRows(TX(t).Work().exec_params(
      "SELECT id,shop,entity_type,entity_id,product_id,change_type,old_value,new_value,trigger_reason,campaign_id,"
      "source_message_id,error,created_at_ms FROM audit_trail WHERE entity_id=$1 ORDER BY seq ASC;",
      entity_id));
}

std::vector<model::AuditRecord> PgRepository::ListCampaignAuditEntries(Transaction& t, const std::string& campaign_id) {
  return ReadAuditRows(TX(t).Work().exec_params(
      "SELECT id,shop,entity_type,entity_id,product_id,change_type,old_value,new_value,trigger_reason,campaign_id,"
      "source_message_id,error,created_at_ms FROM audit_trail WHERE campaign_id=$1 ORDER BY seq ASC;",
      campaign_id));
}

// ------------------------------------------------------------------
// Campaigns
// ------------------------------------------------------------------

static model::CampaignRecord ReadCampaign(const pqxx::row& row) {
  model::CampaignRecord r;
  r.id                   = row[0].c_str();
  r.shop                 = row[1].c_str();
  r.status               = (CampaignStatus)row[2].as<int>();
  r.priority             = row[3].as<int>();
  r.trigger_count        = row[4].as<uint64_t>();
  r.last_triggered_at_ms = row[5].as<uint64_t>();
  r.definition_json      = row[6].c_str();
  r.updated_at_ms        = row[7].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertCampaign(Transaction& t, const model::CampaignRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO campaigns(id,shop,status,priority,trigger_count,last_triggered_at_ms,definition,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8) ON CONFLICT(id) DO UPDATE SET shop=EXCLUDED.shop,status=EXCLUDED.status,"
        "priority=EXCLUDED.priority,trigger_count=EXCLUDED.trigger_count,last_triggered_at_ms=EXCLUDED.last_triggered_at_ms,"
        "definition=EXCLUDED.definition,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id, r.shop, (int)r.status, r.priority, r.trigger_count, r.last_triggered_at_ms, r.definition_json, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CampaignRecord> PgRepository::GetCampaign(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_campaign", id);
  if (res.empty()) return std::nullopt;
  return ReadCampaign(res[0]);
}

std::vector<model::CampaignRecord> PgRepository::ListCampaigns(Transaction& t, const std::string& shop, CampaignStatus status) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,shop,status,priority,trigger_count,last_triggered_at_ms,definition::text,updated_at_ms FROM campaigns "
      "WHERE shop=$1 AND status=$2 ORDER BY priority ASC, id ASC;",
      shop, (int)status);

  std::vector<model::CampaignRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCampaign(row));
  return out;
}

Result PgRepository::IncrementCampaignTriggerCount(Transaction& t, const std::string& id, uint64_t triggered_at_ms) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE campaigns SET trigger_count=trigger_count+1,last_triggered_at_ms=$2 WHERE id=$1;", id,
                                        triggered_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "campaign not found: " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace repricer::db::postgres
