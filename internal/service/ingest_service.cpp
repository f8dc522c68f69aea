#include "ingest_service.hpp"

#include <chrono>

#include "internal/engine/event_processor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "repricer/engine/v1.hpp"

namespace repricer::service {

using namespace repricer::engine::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ProcessEventResponse IngestService::ProcessEvent(const ProcessEventRequest& req) {
  repricer::observability::SpanScope span("IngestService.ProcessEvent");
  const auto                         started_at = std::chrono::steady_clock::now();

  try {
    const auto& event = req.event();
    if (event.message_id().empty()) {
      throw repricer::util::InvalidArgument("event.message_id is required");
    }
    if (event.topic().empty()) {
      throw repricer::util::InvalidArgument("event.topic is required");
    }
    if (event.shop_domain().empty()) {
      throw repricer::util::InvalidArgument("event.shop_domain is required");
    }

    ProcessEventResponse resp;
    *resp.mutable_outcome() = ctx_.processor->Process(event);

    repricer::observability::Metrics::Instance().RecordRequest("IngestService.ProcessEvent", true);
    repricer::observability::Metrics::Instance().ObserveRequestLatencyMs(
        "IngestService.ProcessEvent", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    REPRICER_LOG_ERROR("RPC failed", {repricer::observability::StringField("route", "IngestService.ProcessEvent"),
                                      repricer::observability::StringField("error", ex.what())});
    repricer::observability::Metrics::Instance().RecordRequest("IngestService.ProcessEvent", false);
    repricer::observability::Metrics::Instance().ObserveRequestLatencyMs(
        "IngestService.ProcessEvent", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace repricer::service
