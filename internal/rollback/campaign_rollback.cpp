#include "internal/rollback/campaign_rollback.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "repricer/engine/v1.hpp"

namespace repricer::rollback {

using namespace repricer::engine::v1;
using repricer::engine::services::v1::RollbackCampaignRequest;
using repricer::engine::services::v1::RollbackCampaignResponse;
using repricer::engine::services::v1::VariantRollback;
using repricer::observability::DoubleField;
using repricer::observability::IntField;
using repricer::observability::StringField;

namespace {

std::optional<double> ParseMoney(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char*        end   = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

// Accepts the stored gid or its trailing numeric id.
bool VariantSelected(const RollbackCampaignRequest& req, const std::string& variant_id) {
  if (req.variant_ids().empty()) {
    return true;
  }
  for (const auto& wanted : req.variant_ids()) {
    if (wanted == variant_id) {
      return true;
    }
    const auto slash = variant_id.rfind('/');
    if (slash != std::string::npos && variant_id.compare(slash + 1, std::string::npos, wanted) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace

RollbackPlan PlanRollback(const std::vector<db::model::AuditRecord>& entries) {
  struct Pending {
    RestorePoint point;
    std::string  source_message_id;
    bool         compare_seen = false;
  };

  std::vector<std::string>       order;
  std::map<std::string, Pending> pending;
  std::set<std::string>          touched;

  for (const auto& entry : entries) {
    const auto& variant_id = entry.entity_id;

    if (entry.change_type == "price_update") {
      if (pending.count(variant_id) > 0) {
        continue;
      }
      const auto old_price = ParseMoney(entry.old_value);
      if (!old_price) {
        REPRICER_LOG_WARN("unreadable audit amount", {StringField("audit_id", entry.id), StringField("old_value", entry.old_value)});
        continue;
      }
      touched.insert(variant_id);
      Pending p;
      p.point.shop         = entry.shop;
      p.point.variant_id   = variant_id;
      p.point.product_id   = entry.product_id;
      p.point.price        = *old_price;
      p.source_message_id  = entry.source_message_id;
      if (std::find(order.begin(), order.end(), variant_id) == order.end()) {
        order.push_back(variant_id);
      }
      pending.emplace(variant_id, std::move(p));
    } else if (entry.change_type == "compare_at_update") {
      auto it = pending.find(variant_id);
      if (it != pending.end() && !it->second.compare_seen && it->second.source_message_id == entry.source_message_id) {
        it->second.point.compare_at = ParseMoney(entry.old_value);
        it->second.compare_seen     = true;
      }
    } else if (entry.change_type == "price_rollback" && entry.error.empty()) {
      pending.erase(variant_id);
    }
  }

  RollbackPlan plan;
  for (const auto& variant_id : order) {
    auto it = pending.find(variant_id);
    if (it != pending.end()) {
      plan.restore.push_back(it->second.point);
    }
  }
  plan.already_rolled_back = static_cast<uint32_t>(touched.size() - plan.restore.size());
  return plan;
}

CampaignRollback::CampaignRollback(std::shared_ptr<db::Repository> repository, std::shared_ptr<campaign::CampaignRepository> campaigns,
                                   std::shared_ptr<gateway::CommerceGateway> gateway, std::shared_ptr<audit::AuditRecorder> audit,
                                   std::shared_ptr<lock::LockManager> locks, std::shared_ptr<cooldown::CooldownTracker> cooldowns,
                                   RollbackOptions options)
    : repository_(std::move(repository)),
      campaigns_(std::move(campaigns)),
      gateway_(std::move(gateway)),
      audit_(std::move(audit)),
      locks_(std::move(locks)),
      cooldowns_(std::move(cooldowns)),
      options_(options) {
}

RollbackCampaignResponse CampaignRollback::Rollback(const RollbackCampaignRequest& req) {
  if (req.campaign_id().empty()) {
    throw repricer::util::InvalidArgument("campaign_id is required");
  }
  if (!campaigns_->GetCampaign(req.campaign_id())) {
    throw repricer::util::NotFound("campaign " + req.campaign_id() + " not found");
  }

  std::vector<db::model::AuditRecord> entries;
  {
    auto tx = repository_->Begin();
    entries = repository_->ListCampaignAuditEntries(*tx, req.campaign_id());
    tx->Commit();
  }

  const auto plan = PlanRollback(entries);

  RollbackCampaignResponse resp;
  resp.set_skipped(plan.already_rolled_back);

  if (req.dry_run()) {
    for (const auto& point : plan.restore) {
      if (!VariantSelected(req, point.variant_id)) {
        continue;
      }
      auto* variant = resp.add_variants();
      variant->set_variant_id(point.variant_id);
      variant->set_product_id(point.product_id);
      variant->set_restored_price(point.price);
      if (point.compare_at) variant->set_restored_compare_at(*point.compare_at);
    }
    return resp;
  }

  resp.set_campaign_paused(PauseCampaign(req.campaign_id()));

  for (const auto& point : plan.restore) {
    if (!VariantSelected(req, point.variant_id)) {
      continue;
    }
    auto result = Restore(req.campaign_id(), point);
    if (result.success()) {
      resp.set_restored(resp.restored() + 1);
    } else {
      resp.set_failed(resp.failed() + 1);
    }
    *resp.add_variants() = std::move(result);
  }

  REPRICER_LOG_INFO("campaign rolled back", {StringField("campaign_id", req.campaign_id()), IntField("restored", resp.restored()),
                                             IntField("failed", resp.failed()), IntField("skipped", resp.skipped())});
  return resp;
}

VariantRollback CampaignRollback::Restore(const std::string& campaign_id, const RestorePoint& point) {
  VariantRollback out;
  out.set_variant_id(point.variant_id);
  out.set_product_id(point.product_id);
  out.set_restored_price(point.price);
  if (point.compare_at) out.set_restored_compare_at(*point.compare_at);

  auto guard = locks_->Acquire(lock::LockManager::VariantKey(point.variant_id), LOCK_TYPE_CAMPAIGN_EXECUTION, options_.variant_lock_ttl);
  if (!guard) {
    out.set_error("variant locked");
    return out;
  }

  std::optional<VariantDetails> details;
  PriceUpdateResult             update;
  try {
    details = gateway_->GetVariant(point.shop, point.variant_id);
    if (!details) {
      out.set_error("variant not found");
      return out;
    }
    update = gateway_->UpdateVariantPrice(point.shop, point.product_id, point.variant_id, point.price, point.compare_at);
  } catch (const repricer::util::GatewayError& ex) {
    if (!details) {
      out.set_error(ex.what());
      return out;
    }
    update.set_success(false);
    update.add_errors(ex.what());
  }

  out.set_price_before(details->price());
  out.set_success(update.success());
  for (const auto& error : update.errors()) {
    out.set_error(out.error().empty() ? error : out.error() + "; " + error);
  }

  audit::PriceChange change;
  change.kind           = audit::ChangeKind::kRollback;
  change.shop           = point.shop;
  change.variant_id     = point.variant_id;
  change.product_id     = point.product_id;
  change.campaign_id    = campaign_id;
  change.old_price      = details->price();
  change.new_price      = point.price;
  if (details->has_compare_at_price()) change.old_compare_at = details->compare_at_price();
  change.new_compare_at = point.compare_at;
  change.reason         = "Rollback of campaign " + campaign_id;
  change.success        = update.success();
  change.error          = out.error();
  try {
    audit_->RecordPriceChange(change);
  } catch (const std::exception& ex) {
    REPRICER_LOG_ERROR("audit write failed",
                       {StringField("variant_id", point.variant_id), StringField("campaign_id", campaign_id), StringField("error", ex.what())});
  }
  repricer::observability::Metrics::Instance().RecordPriceMutation(update.success());

  if (!update.success()) {
    REPRICER_LOG_WARN("rollback rejected", {StringField("campaign_id", campaign_id), StringField("variant_id", point.variant_id),
                                            DoubleField("price", point.price), StringField("error", out.error())});
    return out;
  }

  // The platform echoes the restore back as a product update.
  try {
    cooldowns_->Set(point.variant_id, COOLDOWN_TYPE_PRICE_UPDATE, options_.price_update_cooldown);
  } catch (const std::exception& ex) {
    REPRICER_LOG_WARN("rollback cooldown failed", {StringField("variant_id", point.variant_id), StringField("error", ex.what())});
  }

  REPRICER_LOG_INFO("price restored", {StringField("campaign_id", campaign_id), StringField("variant_id", point.variant_id),
                                       DoubleField("old_price", details->price()), DoubleField("new_price", point.price)});
  return out;
}

bool CampaignRollback::PauseCampaign(const std::string& campaign_id) {
  auto campaign = campaigns_->GetCampaign(campaign_id);
  if (!campaign || campaign->status() != CAMPAIGN_STATUS_ACTIVE) {
    return false;
  }
  campaign->set_status(CAMPAIGN_STATUS_PAUSED);
  campaigns_->PutCampaign(*campaign);
  REPRICER_LOG_INFO("campaign paused for rollback", {StringField("campaign_id", campaign_id)});
  return true;
}

} // namespace repricer::rollback
