#include "admin_service.hpp"

#include <chrono>

#include "internal/campaign/campaign_repository.hpp"
#include "internal/cooldown/cooldown_tracker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/event_processor.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/rollback/campaign_rollback.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "repricer/engine/v1.hpp"

namespace repricer::service {

using namespace repricer::engine::v1;

namespace {

void ValidateCampaign(const Campaign& campaign) {
  if (campaign.id().empty()) {
    throw repricer::util::InvalidArgument("campaign.id is required");
  }
  if (campaign.shop().empty()) {
    throw repricer::util::InvalidArgument("campaign.shop is required");
  }
  if (campaign.status() == CAMPAIGN_STATUS_UNSPECIFIED) {
    throw repricer::util::InvalidArgument("campaign.status is required");
  }
  for (const auto& rule : campaign.rules()) {
    if (rule.id().empty()) {
      throw repricer::util::InvalidArgument("campaign " + campaign.id() + ": rule id is required");
    }
    if (rule.when_condition() == CONDITION_KIND_UNSPECIFIED) {
      throw repricer::util::InvalidArgument("rule " + rule.id() + ": when_condition is required");
    }
    if (rule.then_action() == PRICE_ACTION_UNSPECIFIED) {
      throw repricer::util::InvalidArgument("rule " + rule.id() + ": then_action is required");
    }
    if (rule.then_mode() == PRICE_MODE_UNSPECIFIED) {
      throw repricer::util::InvalidArgument("rule " + rule.id() + ": then_mode is required");
    }
    if (rule.then_value() < 0.0) {
      throw repricer::util::InvalidArgument("rule " + rule.id() + ": then_value must be non-negative");
    }
  }
}

RuleStateEntry ToEntry(const db::model::RuleStateRecord& record) {
  RuleStateEntry entry;
  entry.set_campaign_id(record.campaign_id);
  entry.set_rule_id(record.rule_id);
  entry.set_variant_id(record.variant_id);
  entry.set_state(record.state);
  entry.set_last_inventory(record.last_inventory);
  entry.set_last_price(record.last_price);
  entry.set_trigger_count(record.trigger_count);
  if (record.triggered_at_ms > 0) {
    *entry.mutable_triggered_at() = util::ToProto(util::FromUnixMillis(record.triggered_at_ms));
  }
  if (record.cooldown_until_ms > 0) {
    *entry.mutable_cooldown_until() = util::ToProto(util::FromUnixMillis(record.cooldown_until_ms));
  }
  *entry.mutable_updated_at() = util::ToProto(util::FromUnixMillis(record.updated_at_ms));
  return entry;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto AdminService::Instrumented(const char* route, Fn&& fn) -> decltype(fn()) {
  repricer::observability::SpanScope span(route);
  const auto                         started_at = std::chrono::steady_clock::now();

  try {
    auto resp = fn();
    repricer::observability::Metrics::Instance().RecordRequest(route, true);
    repricer::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    REPRICER_LOG_ERROR("RPC failed", {repricer::observability::StringField("route", route), repricer::observability::StringField("error", ex.what())});
    repricer::observability::Metrics::Instance().RecordRequest(route, false);
    repricer::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

PutCampaignResponse AdminService::PutCampaign(const PutCampaignRequest& req) {
  return Instrumented("AdminService.PutCampaign", [&] {
    ValidateCampaign(req.campaign());

    PutCampaignResponse resp;
    *resp.mutable_campaign() = ctx_.campaigns->PutCampaign(req.campaign());
    REPRICER_LOG_INFO("campaign stored", {repricer::observability::StringField("campaign_id", req.campaign().id()),
                                          repricer::observability::StringField("status", CampaignStatus_Name(req.campaign().status())),
                                          repricer::observability::IntField("rules", req.campaign().rules_size())});
    return resp;
  });
}

ListCooldownsResponse AdminService::ListCooldowns(const ListCooldownsRequest& req) {
  return Instrumented("AdminService.ListCooldowns", [&] {
    ListCooldownsResponse resp;
    for (auto& entry : ctx_.cooldowns->List(req.key(), req.include_expired())) {
      *resp.add_cooldowns() = std::move(entry);
    }
    return resp;
  });
}

ClearCooldownResponse AdminService::ClearCooldown(const ClearCooldownRequest& req) {
  return Instrumented("AdminService.ClearCooldown", [&] {
    if (req.key().empty()) {
      throw repricer::util::InvalidArgument("key is required");
    }
    if (req.type() == COOLDOWN_TYPE_UNSPECIFIED) {
      throw repricer::util::InvalidArgument("type is required");
    }

    ClearCooldownResponse resp;
    resp.set_cleared(ctx_.cooldowns->Clear(req.key(), req.type()));
    return resp;
  });
}

CleanupExpiredResponse AdminService::CleanupExpired(const CleanupExpiredRequest&) {
  return Instrumented("AdminService.CleanupExpired", [&] {
    CleanupExpiredResponse resp;
    resp.set_locks_removed(ctx_.locks->CleanupExpired());
    resp.set_cooldowns_removed(ctx_.cooldowns->CleanupExpired());
    return resp;
  });
}

GetRuleStatesResponse AdminService::GetRuleStates(const GetRuleStatesRequest& req) {
  return Instrumented("AdminService.GetRuleStates", [&] {
    if (req.variant_id().empty()) {
      throw repricer::util::InvalidArgument("variant_id is required");
    }

    GetRuleStatesResponse resp;
    auto                  tx      = ctx_.repository->Begin();
    const auto            records = ctx_.repository->ListRuleStates(*tx, req.variant_id());
    tx->Commit();
    for (const auto& record : records) {
      *resp.add_states() = ToEntry(record);
    }
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Instrumented("AdminService.Stats", [&] {
    const auto    stats = ctx_.processor->Stats();
    StatsResponse resp;
    resp.set_events_received(stats.events_received);
    resp.set_events_processed(stats.events_processed);
    resp.set_price_updates(stats.price_updates);
    resp.set_failures(stats.failures);
    resp.set_skipped(stats.skipped);
    return resp;
  });
}

RollbackCampaignResponse AdminService::RollbackCampaign(const RollbackCampaignRequest& req) {
  return Instrumented("AdminService.RollbackCampaign", [&] { return ctx_.rollback->Rollback(req); });
}

} // namespace repricer::service
