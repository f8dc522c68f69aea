#pragma once

#include "repricer/services/v1/repricer_ingest_service.pb.h"
#include "service_context.hpp"

namespace repricer::service {

class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  repricer::engine::services::v1::ProcessEventResponse ProcessEvent(const repricer::engine::services::v1::ProcessEventRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace repricer::service
