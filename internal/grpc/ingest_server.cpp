#include "ingest_server.hpp"

#include "grpc_error.hpp"

namespace repricer::grpc {

using namespace repricer::engine::services::v1;

IngestServer::IngestServer(std::shared_ptr<repricer::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status IngestServer::ProcessEvent(::grpc::ServerContext*, const ProcessEventRequest* req, ProcessEventResponse* resp) {
  try {
    *resp = service_->ProcessEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace repricer::grpc
