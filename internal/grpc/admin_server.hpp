#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "repricer/services/v1/repricer_admin_service.grpc.pb.h"

namespace repricer::grpc {

class AdminServer final : public repricer::engine::services::v1::RepricerAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<repricer::service::AdminService> svc);

  ::grpc::Status PutCampaign(::grpc::ServerContext*, const repricer::engine::services::v1::PutCampaignRequest*,
                             repricer::engine::services::v1::PutCampaignResponse*) override;

  ::grpc::Status ListCooldowns(::grpc::ServerContext*, const repricer::engine::services::v1::ListCooldownsRequest*,
                               repricer::engine::services::v1::ListCooldownsResponse*) override;

  ::grpc::Status ClearCooldown(::grpc::ServerContext*, const repricer::engine::services::v1::ClearCooldownRequest*,
                               repricer::engine::services::v1::ClearCooldownResponse*) override;

  ::grpc::Status CleanupExpired(::grpc::ServerContext*, const repricer::engine::services::v1::CleanupExpiredRequest*,
                                repricer::engine::services::v1::CleanupExpiredResponse*) override;

  ::grpc::Status GetRuleStates(::grpc::ServerContext*, const repricer::engine::services::v1::GetRuleStatesRequest*,
                               repricer::engine::services::v1::GetRuleStatesResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const repricer::engine::services::v1::StatsRequest*,
                       repricer::engine::services::v1::StatsResponse*) override;

  ::grpc::Status RollbackCampaign(::grpc::ServerContext*, const repricer::engine::services::v1::RollbackCampaignRequest*,
                                  repricer::engine::services::v1::RollbackCampaignResponse*) override;

 private:
  std::shared_ptr<repricer::service::AdminService> service_;
};

} // namespace repricer::grpc
