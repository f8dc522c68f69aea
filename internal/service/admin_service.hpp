#pragma once

#include "repricer/services/v1/repricer_admin_service.pb.h"
#include "service_context.hpp"

namespace repricer::service {

/*
  Operator surface: campaign registration and inspection of the
  engine's persisted coordination state.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  repricer::engine::services::v1::PutCampaignResponse PutCampaign(const repricer::engine::services::v1::PutCampaignRequest& req);

  repricer::engine::services::v1::ListCooldownsResponse ListCooldowns(const repricer::engine::services::v1::ListCooldownsRequest& req);

  repricer::engine::services::v1::ClearCooldownResponse ClearCooldown(const repricer::engine::services::v1::ClearCooldownRequest& req);

  repricer::engine::services::v1::CleanupExpiredResponse CleanupExpired(const repricer::engine::services::v1::CleanupExpiredRequest& req);

  repricer::engine::services::v1::GetRuleStatesResponse GetRuleStates(const repricer::engine::services::v1::GetRuleStatesRequest& req);

  repricer::engine::services::v1::StatsResponse Stats(const repricer::engine::services::v1::StatsRequest& req);

  // Restores the prices a campaign changed and pauses it.
  repricer::engine::services::v1::RollbackCampaignResponse RollbackCampaign(
      const repricer::engine::services::v1::RollbackCampaignRequest& req);

 private:
  template <typename Fn>
  auto Instrumented(const char* route, Fn&& fn) -> decltype(fn());

  ServiceContext ctx_;
};

} // namespace repricer::service
