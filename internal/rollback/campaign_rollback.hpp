#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/audit_recorder.hpp"
#include "internal/campaign/campaign_repository.hpp"
#include "internal/cooldown/cooldown_tracker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/gateway/commerce_gateway.hpp"
#include "internal/lock/lock_manager.hpp"
#include "repricer/services/v1/repricer_admin_service.pb.h"

namespace repricer::rollback {

// Price a variant had before a campaign first changed it.
struct RestorePoint {
  std::string           shop;
  std::string           variant_id;
  std::string           product_id;
  double                price = 0.0;
  std::optional<double> compare_at;
};

struct RollbackPlan {
  std::vector<RestorePoint> restore;
  // Variants the campaign changed that are already back at their restore point.
  uint32_t already_rolled_back = 0;
};

/*
  Builds the restore plan for a campaign from its audit entries
  (oldest first).

  Per variant the earliest successful price_update after the last
  successful price_rollback is the restore point; its compare_at_update
  sibling supplies the old compare-at price. Failed attempts and failed
  rollbacks are ignored. Entries with unparseable amounts are skipped.
*/
RollbackPlan PlanRollback(const std::vector<db::model::AuditRecord>& entries);

struct RollbackOptions {
  std::chrono::milliseconds variant_lock_ttl{std::chrono::seconds(120)};
  std::chrono::milliseconds price_update_cooldown{std::chrono::seconds(120)};
};

/*
  Restores the prices a campaign changed.

  The campaign is paused first so it cannot re-fire while prices move
  back. Each variant is restored under its processing lock; a variant
  that is locked, unknown to the platform or rejected by it is reported
  as failed and the rollback moves on. Every attempt writes a
  price_rollback audit entry, so a second rollback of the same campaign
  finds nothing left to restore.
*/
class CampaignRollback {
 public:
  CampaignRollback(std::shared_ptr<db::Repository> repository, std::shared_ptr<campaign::CampaignRepository> campaigns,
                   std::shared_ptr<gateway::CommerceGateway> gateway, std::shared_ptr<audit::AuditRecorder> audit,
                   std::shared_ptr<lock::LockManager> locks, std::shared_ptr<cooldown::CooldownTracker> cooldowns, RollbackOptions options);

  repricer::engine::services::v1::RollbackCampaignResponse Rollback(const repricer::engine::services::v1::RollbackCampaignRequest& req);

 private:
  repricer::engine::services::v1::VariantRollback Restore(const std::string& campaign_id, const RestorePoint& point);

  bool PauseCampaign(const std::string& campaign_id);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<campaign::CampaignRepository> campaigns_;
  std::shared_ptr<gateway::CommerceGateway>     gateway_;
  std::shared_ptr<audit::AuditRecorder>         audit_;
  std::shared_ptr<lock::LockManager>            locks_;
  std::shared_ptr<cooldown::CooldownTracker>    cooldowns_;
  RollbackOptions                               options_;
};

} // namespace repricer::rollback
