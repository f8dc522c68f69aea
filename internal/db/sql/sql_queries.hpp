#pragma once

namespace repricer::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres prepares the same statements with $n placeholders in
  PgPool::PrepareStatements; keep the column order identical so the
  row readers stay interchangeable.
*/

// locks

static constexpr const char* INSERT_LOCK =
    "INSERT INTO processing_locks(lock_key,lock_type,owner,expires_at_ms,created_at_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_LOCK =
    "SELECT lock_key,lock_type,owner,expires_at_ms,created_at_ms"
    " FROM processing_locks WHERE lock_key=?;";

static constexpr const char* RECLAIM_EXPIRED_LOCK =
    "UPDATE processing_locks SET lock_type=?,owner=?,expires_at_ms=?,created_at_ms=?"
    " WHERE lock_key=? AND expires_at_ms<=?;";

static constexpr const char* DELETE_LOCK =
    "DELETE FROM processing_locks WHERE lock_key=? AND owner=?;";

static constexpr const char* DELETE_EXPIRED_LOCKS =
    "DELETE FROM processing_locks WHERE expires_at_ms<=?;";

// cooldowns

static constexpr const char* UPSERT_COOLDOWN =
    "INSERT INTO price_cooldowns(cooldown_key,cooldown_type,campaign_id,expires_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(cooldown_key,cooldown_type) DO UPDATE SET"
    " campaign_id=excluded.campaign_id,"
    " expires_at_ms=excluded.expires_at_ms,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_COOLDOWN =
    "SELECT cooldown_key,cooldown_type,campaign_id,expires_at_ms,updated_at_ms"
    " FROM price_cooldowns WHERE cooldown_key=? AND cooldown_type=?;";

static constexpr const char* SELECT_COOLDOWNS =
    "SELECT cooldown_key,cooldown_type,campaign_id,expires_at_ms,updated_at_ms"
    " FROM price_cooldowns WHERE (?='' OR cooldown_key=?)"
    " ORDER BY cooldown_key,cooldown_type;";

static constexpr const char* DELETE_COOLDOWN =
    "DELETE FROM price_cooldowns WHERE cooldown_key=? AND cooldown_type=?;";

static constexpr const char* DELETE_EXPIRED_COOLDOWNS =
    "DELETE FROM price_cooldowns WHERE expires_at_ms<=?;";

// rule execution state

static constexpr const char* SELECT_RULE_STATE =
    "SELECT campaign_id,rule_id,variant_id,state,last_inventory,last_price,trigger_count,"
    "triggered_at_ms,cooldown_until_ms,updated_at_ms"
    " FROM rule_execution_states WHERE campaign_id=? AND rule_id=? AND variant_id=?;";

static constexpr const char* SELECT_RULE_STATES_FOR_VARIANT =
    "SELECT campaign_id,rule_id,variant_id,state,last_inventory,last_price,trigger_count,"
    "triggered_at_ms,cooldown_until_ms,updated_at_ms"
    " FROM rule_execution_states WHERE variant_id=? ORDER BY campaign_id,rule_id;";

static constexpr const char* UPSERT_RULE_STATE =
    "INSERT INTO rule_execution_states(campaign_id,rule_id,variant_id,state,last_inventory,last_price,"
    "trigger_count,triggered_at_ms,cooldown_until_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(campaign_id,rule_id,variant_id) DO UPDATE SET"
    " state=excluded.state,"
    " last_inventory=excluded.last_inventory,"
    " last_price=excluded.last_price,"
    " trigger_count=excluded.trigger_count,"
    " triggered_at_ms=excluded.triggered_at_ms,"
    " cooldown_until_ms=excluded.cooldown_until_ms,"
    " updated_at_ms=excluded.updated_at_ms;";

// variant history

static constexpr const char* INSERT_VARIANT_SNAPSHOT =
    "INSERT INTO variant_state_history(variant_id,product_id,inventory_quantity,price,compare_at_price,"
    "inventory_change,price_change,reason,captured_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LATEST_VARIANT_SNAPSHOT =
    "SELECT variant_id,product_id,inventory_quantity,price,compare_at_price,inventory_change,price_change,"
    "reason,captured_at_ms"
    " FROM variant_state_history WHERE variant_id=? ORDER BY seq DESC LIMIT 1;";

// audit

static constexpr const char* INSERT_AUDIT =
    "INSERT INTO audit_trail(id,shop,entity_type,entity_id,product_id,change_type,old_value,new_value,"
    "trigger_reason,campaign_id,source_message_id,error,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_AUDIT_FOR_ENTITY =
    "SELECT id,shop,entity_type,entity_id,product_id,change_type,old_value,new_value,"
    "trigger_reason,campaign_id,source_message_id,error,created_at_ms"
    " FROM audit_trail WHERE entity_id=? ORDER BY seq ASC;";

static constexpr const char* SELECT_AUDIT_FOR_CAMPAIGN =
    "SELECT id,shop,entity_type,entity_id,product_id,change_type,old_value,new_value,"
    "trigger_reason,campaign_id,source_message_id,error,created_at_ms"
    " FROM audit_trail WHERE campaign_id=? ORDER BY seq ASC;";

// campaigns

static constexpr const char* UPSERT_CAMPAIGN =
    "INSERT INTO campaigns(id,shop,status,priority,trigger_count,last_triggered_at_ms,definition,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " shop=excluded.shop,"
    " status=excluded.status,"
    " priority=excluded.priority,"
    " trigger_count=excluded.trigger_count,"
    " last_triggered_at_ms=excluded.last_triggered_at_ms,"
    " definition=excluded.definition,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_CAMPAIGN =
    "SELECT id,shop,status,priority,trigger_count,last_triggered_at_ms,definition,updated_at_ms"
    " FROM campaigns WHERE id=?;";

static constexpr const char* SELECT_CAMPAIGNS_BY_SHOP_STATUS =
    "SELECT id,shop,status,priority,trigger_count,last_triggered_at_ms,definition,updated_at_ms"
    " FROM campaigns WHERE shop=? AND status=? ORDER BY priority ASC,id ASC;";

static constexpr const char* INCREMENT_CAMPAIGN_TRIGGER =
    "UPDATE campaigns SET trigger_count=trigger_count+1,last_triggered_at_ms=? WHERE id=?;";

}
