#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "internal/audit/audit_recorder.hpp"
#include "internal/campaign/campaign_repository.hpp"
#include "internal/cooldown/cooldown_tracker.hpp"
#include "internal/engine/engine_options.hpp"
#include "internal/engine/payload_extractor.hpp"
#include "internal/gateway/commerce_gateway.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/rules/rule_state_machine.hpp"
#include "internal/util/time.hpp"
#include "internal/variant/variant_state_capturer.hpp"
#include "repricer/engine/v1/event.pb.h"
#include "repricer/engine/v1/outcome.pb.h"

namespace repricer::engine {

/*
  Collaborators of the event processor, built by the composition root.
*/
struct EngineContext {
  std::shared_ptr<gateway::CommerceGateway>        gateway;
  std::shared_ptr<campaign::CampaignRepository>    campaigns;
  std::shared_ptr<audit::AuditRecorder>            audit;
  std::shared_ptr<lock::LockManager>               locks;
  std::shared_ptr<cooldown::CooldownTracker>       cooldowns;
  std::shared_ptr<variant::VariantStateCapturer>   capturer;
  std::shared_ptr<rules::RuleStateMachine>         rule_states;
};

// Counters since process start.
struct EngineStats {
  uint64_t events_received  = 0;
  uint64_t events_processed = 0;
  uint64_t price_updates    = 0;
  uint64_t failures         = 0;
  uint64_t skipped          = 0;
};

/*
  Orchestrates one inventory change event end to end.

  Order of work:
    message lock -> self-echo -> active campaigns -> extraction ->
    variant lock -> variant cooldown -> pre-emptive cooldown ->
    per-campaign evaluation and mutation

  Every early exit is a normal outcome. Locks are holder-checked and
  released on every path; the pre-emptive variant cooldown is removed
  unless a mutation succeeded. A failing campaign never stops the
  others. Anything else propagates after that cleanup.

  Thread-safe; concurrent calls coordinate through the store only.
*/
class EventProcessor {
 public:
  EventProcessor(EngineContext context, EngineOptions options, util::ClockFn clock = util::Now);

  repricer::engine::v1::ProcessingOutcome Process(const repricer::engine::v1::InventoryChangeEvent& event);

  EngineStats Stats() const;

  const EngineOptions& Options() const {
    return options_;
  }

 private:
  struct VariantView {
    std::string           shop;
    std::string           message_id;
    std::string           variant_id;
    std::string           product_id;
    double                price = 0.0;
    std::optional<double> compare_at;
  };

  void Run(const repricer::engine::v1::InventoryChangeEvent& event, repricer::engine::v1::ProcessingOutcome* outcome);

  bool IsSelfEcho(const repricer::engine::v1::InventoryChangeEvent& event);

  repricer::engine::v1::CampaignResult EvaluateCampaign(const repricer::engine::v1::Campaign& campaign,
                                                        const repricer::engine::v1::VariantDetails& details,
                                                        const repricer::variant::VariantSnapshot& snapshot, VariantView* view);

  void RecordAudit(const audit::PriceChange& change);

  // Runs one post-update step; failures are logged, never thrown.
  template <typename Fn>
  void Bookkeep(const char* step, const std::string& campaign_id, const std::string& variant_id, Fn&& fn);

  void MaybeCleanup();

  EngineContext    context_;
  EngineOptions    options_;
  util::ClockFn    clock_;
  PayloadExtractor extractor_;

  std::mutex   rng_mutex_;
  std::mt19937 rng_;

  std::atomic<uint64_t> events_received_{0};
  std::atomic<uint64_t> events_processed_{0};
  std::atomic<uint64_t> price_updates_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> skipped_{0};
};

} // namespace repricer::engine
