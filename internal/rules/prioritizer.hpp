#pragma once

#include <cstddef>
#include <vector>

#include "internal/rules/rule_state_machine.hpp"
#include "repricer/engine/v1/campaign.pb.h"

namespace repricer::rules {

// A rule whose evaluation said it should execute.
struct RuleMatch {
  repricer::engine::v1::PricingRule rule;
  RuleEvaluation                    evaluation;
};

/*
  Orders applicable rules; only the first is applied.

  Within a condition family the more specific threshold wins: smaller
  for LESS_THAN, larger for GREATER_THAN. Members of a family are
  reordered among the positions that family occupies, so rules of
  different families keep their declaration order relative to each
  other. Equal thresholds keep declaration order.
*/
std::vector<RuleMatch> Prioritize(std::vector<RuleMatch> matches);

} // namespace repricer::rules
