#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace repricer::grpc {

using namespace repricer::engine::services::v1;

AdminServer::AdminServer(std::shared_ptr<repricer::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::PutCampaign(::grpc::ServerContext*, const PutCampaignRequest* req, PutCampaignResponse* resp) {
  try {
    *resp = service_->PutCampaign(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListCooldowns(::grpc::ServerContext*, const ListCooldownsRequest* req, ListCooldownsResponse* resp) {
  try {
    *resp = service_->ListCooldowns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ClearCooldown(::grpc::ServerContext*, const ClearCooldownRequest* req, ClearCooldownResponse* resp) {
  try {
    *resp = service_->ClearCooldown(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::CleanupExpired(::grpc::ServerContext*, const CleanupExpiredRequest* req, CleanupExpiredResponse* resp) {
  try {
    *resp = service_->CleanupExpired(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetRuleStates(::grpc::ServerContext*, const GetRuleStatesRequest* req, GetRuleStatesResponse* resp) {
  try {
    *resp = service_->GetRuleStates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RollbackCampaign(::grpc::ServerContext*, const RollbackCampaignRequest* req, RollbackCampaignResponse* resp) {
  try {
    *resp = service_->RollbackCampaign(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace repricer::grpc
