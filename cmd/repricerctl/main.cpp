#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "repricer/engine/v1.hpp"

using namespace repricer::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  repricerctl <addr> process <event.json>\n"
            << "  repricerctl <addr> put-campaign <campaign.json>\n"
            << "  repricerctl <addr> cooldowns [key] [--all]\n"
            << "  repricerctl <addr> clear-cooldown <key> <price|campaign>\n"
            << "  repricerctl <addr> cleanup\n"
            << "  repricerctl <addr> rule-states <variant_id>\n"
            << "  repricerctl <addr> stats\n"
            << "  repricerctl <addr> rollback <campaign_id> [--dry-run] [variant_id...]\n";
}

static std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

template <typename Message>
static bool ParseJsonFile(const std::string& path, Message* message) {
  auto text = ReadFile(path);
  if (!text) {
    std::cerr << "cannot read " << path << "\n";
    return false;
  }
  auto status = google::protobuf::util::JsonStringToMessage(*text, message);
  if (!status.ok()) {
    std::cerr << path << ": " << status.message() << "\n";
    return false;
  }
  return true;
}

static void PrintJson(const google::protobuf::Message& message) {
  std::string                                 out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    std::cerr << status.message() << "\n";
    return;
  }
  std::cout << out << "\n";
}

static std::optional<CooldownType> ParseCooldownType(const std::string& value) {
  if (value == "price") {
    return COOLDOWN_TYPE_PRICE_UPDATE;
  }
  if (value == "campaign") {
    return COOLDOWN_TYPE_CAMPAIGN_TRIGGER;
  }
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto ingest_stub = RepricerIngestService::NewStub(channel);
  auto admin_stub  = RepricerAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "process") {
    if (argc < 4) return 1;

    ProcessEventRequest req;
    if (!ParseJsonFile(argv[3], req.mutable_event())) return 1;

    ProcessEventResponse resp;
    auto                 status = ingest_stub->ProcessEvent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.outcome());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "put-campaign") {
    if (argc < 4) return 1;

    PutCampaignRequest req;
    if (!ParseJsonFile(argv[3], req.mutable_campaign())) return 1;

    PutCampaignResponse resp;
    auto                status = admin_stub->PutCampaign(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.campaign());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cooldowns") {
    ListCooldownsRequest req;
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--all") {
        req.set_include_expired(true);
      } else {
        req.set_key(arg);
      }
    }

    ListCooldownsResponse resp;
    auto                  status = admin_stub->ListCooldowns(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear-cooldown") {
    if (argc < 5) return 1;

    auto type = ParseCooldownType(argv[4]);
    if (!type) {
      std::cerr << "unsupported cooldown type: " << argv[4] << "\n";
      return 1;
    }

    ClearCooldownRequest req;
    req.set_key(argv[3]);
    req.set_type(*type);

    ClearCooldownResponse resp;
    auto                  status = admin_stub->ClearCooldown(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.cleared() ? "cleared" : "not found") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    CleanupExpiredRequest  req;
    CleanupExpiredResponse resp;
    auto                   status = admin_stub->CleanupExpired(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "locks_removed=" << resp.locks_removed() << " cooldowns_removed=" << resp.cooldowns_removed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "rule-states") {
    if (argc < 4) return 1;

    GetRuleStatesRequest req;
    req.set_variant_id(argv[3]);

    GetRuleStatesResponse resp;
    auto                  status = admin_stub->GetRuleStates(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;
    auto          status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "events_received=" << resp.events_received() << " events_processed=" << resp.events_processed()
              << " price_updates=" << resp.price_updates() << " failures=" << resp.failures() << " skipped=" << resp.skipped() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "rollback") {
    if (argc < 4) return 1;

    RollbackCampaignRequest req;
    req.set_campaign_id(argv[3]);
    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--dry-run") {
        req.set_dry_run(true);
      } else {
        req.add_variant_ids(arg);
      }
    }

    RollbackCampaignResponse resp;
    auto                     status = admin_stub->RollbackCampaign(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  Usage();
  return 1;
}
