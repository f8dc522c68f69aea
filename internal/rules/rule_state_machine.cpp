#include "internal/rules/rule_state_machine.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/rules/condition.hpp"

namespace repricer::rules {

using namespace repricer::engine::v1;
using repricer::observability::StringField;

namespace {

db::model::RuleStateRecord Observe(const PricingRule& rule, const Campaign& campaign, const repricer::variant::VariantSnapshot& snapshot,
                                   uint64_t now_ms) {
  db::model::RuleStateRecord observed;
  observed.campaign_id    = campaign.id();
  observed.rule_id        = rule.id();
  observed.variant_id     = snapshot.variant_id;
  observed.last_inventory = snapshot.inventory;
  observed.last_price     = snapshot.price;
  observed.updated_at_ms  = now_ms;
  return observed;
}

} // namespace

RuleEvaluation Transition(const PricingRule& rule, const std::optional<db::model::RuleStateRecord>& prior, const db::model::RuleStateRecord& observed,
                          uint64_t now_ms, std::chrono::milliseconds rearm_cooldown) {
  RuleEvaluation out;
  out.new_state = observed;
  if (prior) {
    out.new_state.trigger_count     = prior->trigger_count;
    out.new_state.triggered_at_ms   = prior->triggered_at_ms;
    out.new_state.cooldown_until_ms = prior->cooldown_until_ms;
  }

  const auto inventory     = observed.last_inventory;
  const bool condition_now = Matches(rule, inventory);
  const auto condition     = DescribeCondition(rule);

  auto fire = [&](std::string reason) {
    if (rearm_cooldown.count() > 0 && prior && prior->cooldown_until_ms > now_ms) {
      out.new_state.state = RULE_STATE_COOLING_DOWN;
      out.reason          = fmt::format("Crossing during re-arm cooldown ({}ms remaining)", prior->cooldown_until_ms - now_ms);
      return;
    }
    out.should_execute              = true;
    out.reason                      = std::move(reason);
    out.new_state.state             = RULE_STATE_TRIGGERED;
    out.new_state.trigger_count     = out.new_state.trigger_count + 1;
    out.new_state.triggered_at_ms   = now_ms;
    out.new_state.cooldown_until_ms = rearm_cooldown.count() > 0 ? now_ms + static_cast<uint64_t>(rearm_cooldown.count()) : 0;
  };

  if (!prior) {
    if (condition_now) {
      fire(fmt::format("Initial condition met: {} {}", inventory, condition));
    } else {
      out.new_state.state = RULE_STATE_INACTIVE;
      out.reason          = fmt::format("Condition not met: {} not {}", inventory, condition);
    }
    return out;
  }

  const bool condition_before = Matches(rule, prior->last_inventory);
  const auto crossing_reason  = fmt::format("Threshold crossed: {} -> {} ({})", prior->last_inventory, inventory, condition);

  switch (prior->state) {
    case RULE_STATE_TRIGGERED:
      if (condition_now) {
        out.new_state.state = RULE_STATE_TRIGGERED;
        out.reason          = "Rule already triggered - awaiting reset condition";
      } else {
        out.new_state.state = RULE_STATE_RESET_PENDING;
        out.reason          = "Reset condition met - rule ready for next crossing";
      }
      return out;

    case RULE_STATE_COOLING_DOWN:
      if (!condition_now) {
        out.new_state.state = RULE_STATE_INACTIVE;
        out.reason          = fmt::format("Condition cleared during re-arm cooldown: {} not {}", inventory, condition);
      } else if (now_ms >= prior->cooldown_until_ms) {
        fire(fmt::format("Re-arm cooldown elapsed: {} {}", inventory, condition));
      } else {
        out.new_state.state = RULE_STATE_COOLING_DOWN;
        out.reason          = fmt::format("Re-arm cooldown active ({}ms remaining)", prior->cooldown_until_ms - now_ms);
      }
      return out;

    case RULE_STATE_RESET_PENDING:
      if (!condition_now) {
        out.new_state.state = RULE_STATE_INACTIVE;
        out.reason          = fmt::format("Condition not met: {} not {}", inventory, condition);
      } else if (!condition_before) {
        fire("Re-triggered after reset: " + crossing_reason);
      } else {
        out.new_state.state = RULE_STATE_RESET_PENDING;
        out.reason          = "Condition met but no threshold crossing detected";
      }
      return out;

    default:
      if (!condition_now) {
        out.new_state.state = RULE_STATE_INACTIVE;
        out.reason          = fmt::format("Condition not met: {} not {}", inventory, condition);
      } else if (!condition_before) {
        fire(crossing_reason);
      } else {
        out.new_state.state = RULE_STATE_INACTIVE;
        out.reason          = "Condition met but no threshold crossing detected";
      }
      return out;
  }
}

RuleStateMachine::RuleStateMachine(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds rearm_cooldown, util::ClockFn clock)
    : repository_(std::move(repository)), rearm_cooldown_(rearm_cooldown), clock_(std::move(clock)) {
}

RuleEvaluation RuleStateMachine::Evaluate(const PricingRule& rule, const Campaign& campaign, const repricer::variant::VariantSnapshot& snapshot) {
  auto result = EvaluateStateful(rule, campaign, snapshot);
  if (auto* evaluation = std::get_if<RuleEvaluation>(&result)) {
    return std::move(*evaluation);
  }

  const auto& error = std::get<EvaluationError>(result);
  REPRICER_LOG_WARN("rule state unavailable; using level check",
                    {StringField("campaign_id", campaign.id()), StringField("rule_id", rule.id()), StringField("variant_id", snapshot.variant_id),
                     StringField("error", error.message)});
  return EvaluateDegraded(rule, campaign, snapshot, error);
}

StatefulEvaluation RuleStateMachine::EvaluateStateful(const PricingRule& rule, const Campaign& campaign,
                                                      const repricer::variant::VariantSnapshot& snapshot) {
  const auto now_ms   = util::ToUnixMillis(clock_());
  const auto observed = Observe(rule, campaign, snapshot, now_ms);

  try {
    auto tx    = repository_->Begin();
    auto prior = repository_->GetRuleState(*tx, campaign.id(), rule.id(), snapshot.variant_id);

    auto evaluation = Transition(rule, prior, observed, now_ms, rearm_cooldown_);

    auto result = repository_->UpsertRuleState(*tx, evaluation.new_state);
    if (!result) {
      return EvaluationError{fmt::format("persist rule state: {} {}", db::ToString(result.code), result.message)};
    }
    tx->Commit();
    return evaluation;
  } catch (const std::exception& e) {
    return EvaluationError{e.what()};
  }
}

RuleEvaluation RuleStateMachine::EvaluateDegraded(const PricingRule& rule, const Campaign& campaign, const repricer::variant::VariantSnapshot& snapshot,
                                                  const EvaluationError& error) {
  const auto now_ms = util::ToUnixMillis(snapshot.captured_at);

  RuleEvaluation out;
  out.mode           = EvaluationMode::kDegraded;
  out.new_state      = Observe(rule, campaign, snapshot, now_ms);
  out.should_execute = Matches(rule, snapshot.inventory);
  out.new_state.state = out.should_execute ? RULE_STATE_TRIGGERED : RULE_STATE_INACTIVE;
  if (out.should_execute) {
    out.new_state.trigger_count   = 1;
    out.new_state.triggered_at_ms = now_ms;
  }
  out.reason = fmt::format("{} level check, condition {}: {} {} (state store: {})", kFallbackReasonPrefix,
                           out.should_execute ? "met" : "not met", snapshot.inventory, DescribeCondition(rule), error.message);
  return out;
}

} // namespace repricer::rules
