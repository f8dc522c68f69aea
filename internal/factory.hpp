#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/engine/event_processor.hpp"
#include "internal/gateway/commerce_gateway.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"

namespace repricer::factory {

/*
  Application

  Owns every long-lived component of the server. Everything here
  lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<engine::EventProcessor>    processor;
  std::shared_ptr<service::IngestService>    ingest_service;
  std::shared_ptr<service::AdminService>     admin_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The only place that knows concrete backend types.

  With no database backend configured the in-memory repository is
  used, which only coordinates a single process.
*/
std::shared_ptr<db::Repository> BuildRepository(const repricer::runtime::config::RuntimeConfig& config);

std::shared_ptr<gateway::CommerceGateway> BuildGateway(const repricer::runtime::config::RuntimeConfig& config);

// Wires the engine around an existing repository and gateway.
Application Build(const repricer::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                  std::shared_ptr<gateway::CommerceGateway> gateway);

Application Build(const repricer::runtime::config::RuntimeConfig& config);

} // namespace repricer::factory
