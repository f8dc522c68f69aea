#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace repricer::db::sqlite {

using repricer::db::ErrorCode;
using repricer::db::Result;
using repricer::engine::v1::CampaignStatus;
using repricer::engine::v1::CooldownType;

namespace {

// Prepared statement finalized on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

  // Reads treat any failure as a backend fault.
  void EnsurePrepared(const char* what) const {
    if (!Prepared()) {
      throw std::runtime_error(std::string("sqlite prepare ") + what + ": " + sqlite3_errmsg(db_));
    }
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

static void ThrowStep(sqlite3* db, int rc, const char* what) {
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step ") + what + ": " + sqlite3_errmsg(db));
    }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

static model::LockRecord ReadLock(sqlite3_stmt* st) {
    model::LockRecord r;
    r.lock_key      = ColText(st, 0);
    r.type          = static_cast<repricer::engine::v1::LockType>(ColI32(st, 1));
    r.owner         = ColText(st, 2);
    r.expires_at_ms = ColU64(st, 3);
    r.created_at_ms = ColU64(st, 4);
    return r;
}

Result SqliteRepository::InsertLock(Transaction& t, const model::LockRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_LOCK);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.lock_key);
    BindI32(st.get(), 2, static_cast<int>(r.type));
    BindText(st.get(), 3, r.owner);
    BindU64(st.get(), 4, r.expires_at_ms);
    BindU64(st.get(), 5, r.created_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::LockRecord> SqliteRepository::GetLock(Transaction& t, const std::string& lock_key) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_LOCK);
    st.EnsurePrepared("GetLock");
    BindText(st.get(), 1, lock_key);

    int rc = st.Step();
    ThrowStep(db, rc, "GetLock");
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadLock(st.get());
}

Result SqliteRepository::ReclaimExpiredLock(Transaction& t, const model::LockRecord& r, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::RECLAIM_EXPIRED_LOCK);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.type));
    BindText(st.get(), 2, r.owner);
    BindU64(st.get(), 3, r.expires_at_ms);
    BindU64(st.get(), 4, r.created_at_ms);
    BindText(st.get(), 5, r.lock_key);
    BindU64(st.get(), 6, now_ms);

    auto result = Translate(db, st.Step());
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "lock still live: " + r.lock_key);
    return Result::Ok();
}

Result SqliteRepository::DeleteLock(Transaction& t, const std::string& lock_key, const std::string& owner) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_LOCK);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, lock_key);
    BindText(st.get(), 2, owner);

    auto result = Translate(db, st.Step());
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::DeleteExpiredLocks(Transaction& t, uint64_t now_ms, uint64_t* removed) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_EXPIRED_LOCKS);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, now_ms);

    auto result = Translate(db, st.Step());
    if (result && removed) *removed = static_cast<uint64_t>(sqlite3_changes(db));
    return result;
}

// ------------------------------------------------------------------
// Cooldowns
// ------------------------------------------------------------------

static model::CooldownRecord ReadCooldown(sqlite3_stmt* st) {
    model::CooldownRecord r;
    r.cooldown_key  = ColText(st, 0);
    r.type          = static_cast<CooldownType>(ColI32(st, 1));
    r.campaign_id   = ColText(st, 2);
    r.expires_at_ms = ColU64(st, 3);
    r.updated_at_ms = ColU64(st, 4);
    return r;
}

Result SqliteRepository::UpsertCooldown(Transaction& t, const model::CooldownRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_COOLDOWN);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.cooldown_key);
    BindI32(st.get(), 2, static_cast<int>(r.type));
    BindText(st.get(), 3, r.campaign_id);
    BindU64(st.get(), 4, r.expires_at_ms);
    BindU64(st.get(), 5, r.updated_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::CooldownRecord> SqliteRepository::GetCooldown(Transaction& t, const std::string& key, CooldownType type) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_COOLDOWN);
    st.EnsurePrepared("GetCooldown");
    BindText(st.get(), 1, key);
    BindI32(st.get(), 2, static_cast<int>(type));

    int rc = st.Step();
    ThrowStep(db, rc, "GetCooldown");
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadCooldown(st.get());
}

Result SqliteRepository::DeleteCooldown(Transaction& t, const std::string& key, CooldownType type) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_COOLDOWN);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, key);
    BindI32(st.get(), 2, static_cast<int>(type));

    auto result = Translate(db, st.Step());
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::vector<model::CooldownRecord> SqliteRepository::ListCooldowns(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_COOLDOWNS);
    st.EnsurePrepared("ListCooldowns");
    BindText(st.get(), 1, key);
    BindText(st.get(), 2, key);

    std::vector<model::CooldownRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadCooldown(st.get()));
    }
    ThrowStep(db, rc, "ListCooldowns");
    return out;
}

Result SqliteRepository::DeleteExpiredCooldowns(Transaction& t, uint64_t now_ms, uint64_t* removed) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_EXPIRED_COOLDOWNS);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, now_ms);

    auto result = Translate(db, st.Step());
    if (result && removed) *removed = static_cast<uint64_t>(sqlite3_changes(db));
    return result;
}

// ------------------------------------------------------------------
// Rule execution state
// ------------------------------------------------------------------

static model::RuleStateRecord ReadRuleState(sqlite3_stmt* st) {
    model::RuleStateRecord r;
    r.campaign_id       = ColText(st, 0);
    r.rule_id           = ColText(st, 1);
    r.variant_id        = ColText(st, 2);
    r.state             = static_cast<repricer::engine::v1::RuleState>(ColI32(st, 3));
    r.last_inventory    = ColI64(st, 4);
    r.last_price        = ColDouble(st, 5);
    r.trigger_count     = ColU64(st, 6);
    r.triggered_at_ms   = ColU64(st, 7);
    r.cooldown_until_ms = ColU64(st, 8);
    r.updated_at_ms     = ColU64(st, 9);
    return r;
}

std::optional<model::RuleStateRecord> SqliteRepository::GetRuleState(Transaction& t, const std::string& campaign_id, const std::string& rule_id,
                                                                     const std::string& variant_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_RULE_STATE);
    st.EnsurePrepared("GetRuleState");
    BindText(st.get(), 1, campaign_id);
    BindText(st.get(), 2, rule_id);
    BindText(st.get(), 3, variant_id);

    int rc = st.Step();
    ThrowStep(db, rc, "GetRuleState");
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadRuleState(st.get());
}

Result SqliteRepository::UpsertRuleState(Transaction& t, const model::RuleStateRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_RULE_STATE);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.campaign_id);
    BindText(st.get(), 2, r.rule_id);
    BindText(st.get(), 3, r.variant_id);
    BindI32(st.get(), 4, static_cast<int>(r.state));
    BindI64(st.get(), 5, r.last_inventory);
    BindDouble(st.get(), 6, r.last_price);
    BindU64(st.get(), 7, r.trigger_count);
    BindU64(st.get(), 8, r.triggered_at_ms);
    BindU64(st.get(), 9, r.cooldown_until_ms);
    BindU64(st.get(), 10, r.updated_at_ms);

    return Translate(db, st.Step());
}

std::vector<model::RuleStateRecord> SqliteRepository::ListRuleStates(Transaction& t, const std::string& variant_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_RULE_STATES_FOR_VARIANT);
    st.EnsurePrepared("ListRuleStates");
    BindText(st.get(), 1, variant_id);

    std::vector<model::RuleStateRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadRuleState(st.get()));
    }
    ThrowStep(db, rc, "ListRuleStates");
    return out;
}

// ------------------------------------------------------------------
// Variant history
// ------------------------------------------------------------------

Result SqliteRepository::InsertVariantSnapshot(Transaction& t, const model::VariantSnapshotRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_VARIANT_SNAPSHOT);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.variant_id);
    BindText(st.get(), 2, r.product_id);
    BindI64(st.get(), 3, r.inventory_quantity);
    BindDouble(st.get(), 4, r.price);
    if (r.compare_at_price) {
        BindDouble(st.get(), 5, *r.compare_at_price);
    } else {
        sqlite3_bind_null(st.get(), 5);
    }
    BindI64(st.get(), 6, r.inventory_change);
    BindDouble(st.get(), 7, r.price_change);
    BindText(st.get(), 8, r.reason);
    BindU64(st.get(), 9, r.captured_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::VariantSnapshotRecord> SqliteRepository::GetLatestVariantSnapshot(Transaction& t, const std::string& variant_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_LATEST_VARIANT_SNAPSHOT);
    st.EnsurePrepared("GetLatestVariantSnapshot");
    BindText(st.get(), 1, variant_id);

    int rc = st.Step();
    ThrowStep(db, rc, "GetLatestVariantSnapshot");
    if (rc != SQLITE_ROW) return std::nullopt;

    model::VariantSnapshotRecord r;
    r.variant_id         = ColText(st.get(), 0);
    r.product_id         = ColText(st.get(), 1);
    r.inventory_quantity = ColI64(st.get(), 2);
    r.price              = ColDouble(st.get(), 3);
    if (sqlite3_column_type(st.get(), 4) != SQLITE_NULL) {
        r.compare_at_price = ColDouble(st.get(), 4);
    }
    r.inventory_change = ColI64(st.get(), 5);
    r.price_change     = ColDouble(st.get(), 6);
    r.reason           = ColText(st.get(), 7);
    r.captured_at_ms   = ColU64(st.get(), 8);
    return r;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertAuditEntry(Transaction& t, const model::AuditRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_AUDIT);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.shop);
    BindText(st.get(), 3, r.entity_type);
    BindText(st.get(), 4, r.entity_id);
    BindText(st.get(), 5, r.product_id);
    BindText(st.get(), 6, r.change_type);
    BindText(st.get(), 7, r.old_value);
    BindText(st.get(), 8, r.new_value);
    BindText(st.get(), 9, r.trigger_reason);
    BindText(st.get(), 10, r.campaign_id);
    BindText(st.get(), 11, r.source_message_id);
    BindText(st.get(), 12, r.error);
    BindU64(st.get(), 13, r.created_at_ms);

    return Translate(db, st.Step());
}

static std::vector<model::AuditRecord> ReadAuditRows(sqlite3* db, const char* query, const std::string& filter, const char* ctx) {
    Statement st(db, query);
    st.EnsurePrepared(ctx);
    BindText(st.get(), 1, filter);

    std::vector<model::AuditRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        model::AuditRecord r;
        r.id                = ColText(st.get(), 0);
        r.shop              = ColText(st.get(), 1);
        r.entity_type       = ColText(st.get(), 2);
        r.entity_id         = ColText(st.get(), 3);
        r.product_id        = ColText(st.get(), 4);
        r.change_type       = ColText(st.get(), 5);
        r.old_value         = ColText(st.get(), 6);
        r.new_value         = ColText(st.get(), 7);
        r.trigger_reason    = ColText(st.get(), 8);
        r.campaign_id       = ColText(st.get(), 9);
        r.source_message_id = ColText(st.get(), 10);
        r.error             = ColText(st.get(), 11);
        r.created_at_ms     = ColU64(st.get(), 12);
        out.push_back(std::move(r));
    }
    ThrowStep(db, rc, ctx);
    return out;
}

std::vector<model::AuditRecord> SqliteRepository::ListAuditEntries(Transaction& t, const std::string& entity_id) {
    return ReadAuditRows(TX(t).Handle(), sql::SELECT_AUDIT_FOR_ENTITY, entity_id, "ListAuditEntries");
}

std::vector<model::AuditRecord> SqliteRepository::ListCampaignAuditEntries(Transaction& t, const std::string& campaign_id) {
    return ReadAuditRows(TX(t).Handle(), sql::SELECT_AUDIT_FOR_CAMPAIGN, campaign_id, "ListCampaignAuditEntries");
}

// ------------------------------------------------------------------
// Campaigns
// ------------------------------------------------------------------

static model::CampaignRecord ReadCampaign(sqlite3_stmt* st) {
    model::CampaignRecord r;
    r.id                   = ColText(st, 0);
    r.shop                 = ColText(st, 1);
    r.status               = static_cast<CampaignStatus>(ColI32(st, 2));
    r.priority             = ColI32(st, 3);
    r.trigger_count        = ColU64(st, 4);
    r.last_triggered_at_ms = ColU64(st, 5);
    r.definition_json      = ColText(st, 6);
    r.updated_at_ms        = ColU64(st, 7);
    return r;
}

Result SqliteRepository::UpsertCampaign(Transaction& t, const model::CampaignRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_CAMPAIGN);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.shop);
    BindI32(st.get(), 3, static_cast<int>(r.status));
    BindI32(st.get(), 4, r.priority);
    BindU64(st.get(), 5, r.trigger_count);
    BindU64(st.get(), 6, r.last_triggered_at_ms);
    BindText(st.get(), 7, r.definition_json);
    BindU64(st.get(), 8, r.updated_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::CampaignRecord> SqliteRepository::GetCampaign(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_CAMPAIGN);
    st.EnsurePrepared("GetCampaign");
    BindText(st.get(), 1, id);

    int rc = st.Step();
    ThrowStep(db, rc, "GetCampaign");
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadCampaign(st.get());
}

std::vector<model::CampaignRecord> SqliteRepository::ListCampaigns(Transaction& t, const std::string& shop, CampaignStatus status) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_CAMPAIGNS_BY_SHOP_STATUS);
    st.EnsurePrepared("ListCampaigns");
    BindText(st.get(), 1, shop);
    BindI32(st.get(), 2, static_cast<int>(status));

    std::vector<model::CampaignRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadCampaign(st.get()));
    }
    ThrowStep(db, rc, "ListCampaigns");
    return out;
}

Result SqliteRepository::IncrementCampaignTriggerCount(Transaction& t, const std::string& id, uint64_t triggered_at_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INCREMENT_CAMPAIGN_TRIGGER);
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, triggered_at_ms);
    BindText(st.get(), 2, id);

    auto result = Translate(db, st.Step());
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "campaign not found: " + id);
    return Result::Ok();
}

} // namespace repricer::db::sqlite
