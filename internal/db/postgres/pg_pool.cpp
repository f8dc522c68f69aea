#include "pg_pool.hpp"

namespace repricer::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_lock",
               "INSERT INTO processing_locks(lock_key,lock_type,owner,expires_at_ms,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5) ON CONFLICT (lock_key) DO NOTHING");

  conn.prepare("get_lock",
               "SELECT lock_key,lock_type,owner,expires_at_ms,created_at_ms "
               "FROM processing_locks WHERE lock_key=$1");

  conn.prepare("reclaim_expired_lock",
               "UPDATE processing_locks SET lock_type=$2,owner=$3,expires_at_ms=$4,created_at_ms=$5 "
               "WHERE lock_key=$1 AND expires_at_ms<=$6");

  conn.prepare("delete_lock", "DELETE FROM processing_locks WHERE lock_key=$1 AND owner=$2");

  conn.prepare("upsert_cooldown",
               "INSERT INTO price_cooldowns(cooldown_key,cooldown_type,campaign_id,expires_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5) ON CONFLICT (cooldown_key,cooldown_type) DO UPDATE SET "
               "campaign_id=EXCLUDED.campaign_id,expires_at_ms=EXCLUDED.expires_at_ms,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_cooldown",
               "SELECT cooldown_key,cooldown_type,campaign_id,expires_at_ms,updated_at_ms "
               "FROM price_cooldowns WHERE cooldown_key=$1 AND cooldown_type=$2");

  conn.prepare("get_rule_state",
               "SELECT campaign_id,rule_id,variant_id,state,last_inventory,last_price,trigger_count,"
               "triggered_at_ms,cooldown_until_ms,updated_at_ms FROM rule_execution_states "
               "WHERE campaign_id=$1 AND rule_id=$2 AND variant_id=$3");

  conn.prepare("upsert_rule_state",
               "INSERT INTO rule_execution_states(campaign_id,rule_id,variant_id,state,last_inventory,last_price,"
               "trigger_count,triggered_at_ms,cooldown_until_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
               "ON CONFLICT (campaign_id,rule_id,variant_id) DO UPDATE SET state=EXCLUDED.state,"
               "last_inventory=EXCLUDED.last_inventory,last_price=EXCLUDED.last_price,trigger_count=EXCLUDED.trigger_count,"
               "triggered_at_ms=EXCLUDED.triggered_at_ms,cooldown_until_ms=EXCLUDED.cooldown_until_ms,"
               "updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_latest_variant_snapshot",
               "SELECT variant_id,product_id,inventory_quantity,price,compare_at_price,inventory_change,price_change,"
               "reason,captured_at_ms FROM variant_state_history WHERE variant_id=$1 ORDER BY seq DESC LIMIT 1");

  conn.prepare("get_campaign",
               "SELECT id,shop,status,priority,trigger_count,last_triggered_at_ms,definition::text,updated_at_ms "
               "FROM campaigns WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace repricer::db::postgres
