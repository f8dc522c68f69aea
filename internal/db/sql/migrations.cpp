#include "internal/db/sql/migrations.hpp"

namespace repricer::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS processing_locks (lock_key TEXT PRIMARY KEY, lock_type INTEGER NOT NULL, owner TEXT NOT NULL, expires_at_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS processing_locks_expiry_idx ON processing_locks(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS price_cooldowns (cooldown_key TEXT NOT NULL, cooldown_type INTEGER NOT NULL, campaign_id TEXT NOT NULL DEFAULT '', expires_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (cooldown_key, cooldown_type));",
      "CREATE INDEX IF NOT EXISTS price_cooldowns_expiry_idx ON price_cooldowns(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS rule_execution_states (campaign_id TEXT NOT NULL, rule_id TEXT NOT NULL, variant_id TEXT NOT NULL, state INTEGER NOT NULL, last_inventory INTEGER NOT NULL, last_price REAL NOT NULL, trigger_count INTEGER NOT NULL, triggered_at_ms INTEGER NOT NULL, cooldown_until_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (campaign_id, rule_id, variant_id));",
      "CREATE INDEX IF NOT EXISTS rule_execution_states_variant_idx ON rule_execution_states(variant_id);",
      "CREATE TABLE IF NOT EXISTS variant_state_history (seq INTEGER PRIMARY KEY AUTOINCREMENT, variant_id TEXT NOT NULL, product_id TEXT NOT NULL, inventory_quantity INTEGER NOT NULL, price REAL NOT NULL, compare_at_price REAL, inventory_change INTEGER NOT NULL, price_change REAL NOT NULL, reason TEXT NOT NULL DEFAULT '', captured_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS variant_state_history_variant_idx ON variant_state_history(variant_id, seq);",
      "CREATE TABLE IF NOT EXISTS audit_trail (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, shop TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, product_id TEXT NOT NULL, change_type TEXT NOT NULL, old_value TEXT NOT NULL, new_value TEXT NOT NULL, trigger_reason TEXT NOT NULL, campaign_id TEXT NOT NULL, source_message_id TEXT NOT NULL, error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS audit_trail_entity_idx ON audit_trail(entity_id, seq);",
      "CREATE INDEX IF NOT EXISTS audit_trail_campaign_idx ON audit_trail(campaign_id, seq);",
      "CREATE TABLE IF NOT EXISTS campaigns (id TEXT PRIMARY KEY, shop TEXT NOT NULL, status INTEGER NOT NULL, priority INTEGER NOT NULL, trigger_count INTEGER NOT NULL DEFAULT 0, last_triggered_at_ms INTEGER NOT NULL DEFAULT 0, definition TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS campaigns_shop_status_idx ON campaigns(shop, status, priority);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS processing_locks (lock_key TEXT PRIMARY KEY, lock_type SMALLINT NOT NULL, owner TEXT NOT NULL, expires_at_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS processing_locks_expiry_idx ON processing_locks(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS price_cooldowns (cooldown_key TEXT NOT NULL, cooldown_type SMALLINT NOT NULL, campaign_id TEXT NOT NULL DEFAULT '', expires_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (cooldown_key, cooldown_type));",
      "CREATE INDEX IF NOT EXISTS price_cooldowns_expiry_idx ON price_cooldowns(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS rule_execution_states (campaign_id TEXT NOT NULL, rule_id TEXT NOT NULL, variant_id TEXT NOT NULL, state SMALLINT NOT NULL, last_inventory BIGINT NOT NULL, last_price DOUBLE PRECISION NOT NULL, trigger_count BIGINT NOT NULL, triggered_at_ms BIGINT NOT NULL, cooldown_until_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (campaign_id, rule_id, variant_id));",
      "CREATE INDEX IF NOT EXISTS rule_execution_states_variant_idx ON rule_execution_states(variant_id);",
      "CREATE TABLE IF NOT EXISTS variant_state_history (seq BIGSERIAL PRIMARY KEY, variant_id TEXT NOT NULL, product_id TEXT NOT NULL, inventory_quantity BIGINT NOT NULL, price DOUBLE PRECISION NOT NULL, compare_at_price DOUBLE PRECISION, inventory_change BIGINT NOT NULL, price_change DOUBLE PRECISION NOT NULL, reason TEXT NOT NULL DEFAULT '', captured_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS variant_state_history_variant_idx ON variant_state_history(variant_id, seq);",
      "CREATE TABLE IF NOT EXISTS audit_trail (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, shop TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, product_id TEXT NOT NULL, change_type TEXT NOT NULL, old_value TEXT NOT NULL, new_value TEXT NOT NULL, trigger_reason TEXT NOT NULL, campaign_id TEXT NOT NULL, source_message_id TEXT NOT NULL, error TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS audit_trail_entity_idx ON audit_trail(entity_id, seq);",
      "CREATE INDEX IF NOT EXISTS audit_trail_campaign_idx ON audit_trail(campaign_id, seq);",
      "CREATE TABLE IF NOT EXISTS campaigns (id TEXT PRIMARY KEY, shop TEXT NOT NULL, status SMALLINT NOT NULL, priority INTEGER NOT NULL, trigger_count BIGINT NOT NULL DEFAULT 0, last_triggered_at_ms BIGINT NOT NULL DEFAULT 0, definition JSONB NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS campaigns_shop_status_idx ON campaigns(shop, status, priority);",
  };
  return kSchema;
}

} // namespace repricer::db::sql
