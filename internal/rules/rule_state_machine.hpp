#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "internal/variant/variant_state_capturer.hpp"
#include "repricer/engine/v1/campaign.pb.h"

namespace repricer::rules {

enum class EvaluationMode {
  kStateful,
  // persisted state was unavailable; level check only
  kDegraded,
};

struct RuleEvaluation {
  bool                       should_execute = false;
  std::string                reason;
  db::model::RuleStateRecord new_state;
  EvaluationMode             mode = EvaluationMode::kStateful;
};

struct EvaluationError {
  std::string message;
};

using StatefulEvaluation = std::variant<RuleEvaluation, EvaluationError>;

inline constexpr const char* kFallbackReasonPrefix = "FALLBACK:";

/*
  Threshold-crossing transition for one observation.

  Pure: `prior` is the persisted row (nullopt on first evaluation),
  `observed` carries the keys and the captured inventory/price. A rule
  fires only when its condition is newly true and it is not already
  TRIGGERED. With a non-zero re-arm cooldown a crossing seen before
  the previous trigger's cooldown_until parks the rule in COOLING_DOWN.
*/
RuleEvaluation Transition(const repricer::engine::v1::PricingRule& rule, const std::optional<db::model::RuleStateRecord>& prior,
                          const db::model::RuleStateRecord& observed, uint64_t now_ms, std::chrono::milliseconds rearm_cooldown);

/*
  Evaluates rules against a variant snapshot and persists the resulting
  execution state per (campaign, rule, variant).

  EvaluateStateful reports store trouble as EvaluationError. Evaluate
  folds that into a degraded level check whose reason starts with
  "FALLBACK:"; a degraded evaluation keeps firing while the condition
  holds.
*/
class RuleStateMachine {
 public:
  RuleStateMachine(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds rearm_cooldown, util::ClockFn clock = util::Now);

  RuleEvaluation Evaluate(const repricer::engine::v1::PricingRule& rule, const repricer::engine::v1::Campaign& campaign,
                          const repricer::variant::VariantSnapshot& snapshot);

  StatefulEvaluation EvaluateStateful(const repricer::engine::v1::PricingRule& rule, const repricer::engine::v1::Campaign& campaign,
                                      const repricer::variant::VariantSnapshot& snapshot);

  static RuleEvaluation EvaluateDegraded(const repricer::engine::v1::PricingRule& rule, const repricer::engine::v1::Campaign& campaign,
                                         const repricer::variant::VariantSnapshot& snapshot, const EvaluationError& error);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       rearm_cooldown_;
  util::ClockFn                   clock_;
};

} // namespace repricer::rules
