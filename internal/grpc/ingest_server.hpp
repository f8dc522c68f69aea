#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/ingest_service.hpp"
#include "repricer/services/v1/repricer_ingest_service.grpc.pb.h"

namespace repricer::grpc {

class IngestServer final : public repricer::engine::services::v1::RepricerIngestService::Service {
 public:
  explicit IngestServer(std::shared_ptr<repricer::service::IngestService> svc);

  ::grpc::Status ProcessEvent(::grpc::ServerContext*, const repricer::engine::services::v1::ProcessEventRequest*,
                              repricer::engine::services::v1::ProcessEventResponse*) override;

 private:
  std::shared_ptr<repricer::service::IngestService> service_;
};

} // namespace repricer::grpc
