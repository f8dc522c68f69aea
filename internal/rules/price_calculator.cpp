#include "internal/rules/price_calculator.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace repricer::rules {

using namespace repricer::engine::v1;

double RoundToCents(double value) {
  return std::round(value * 100.0) / 100.0;
}

double ComputePrice(double current, const PricingRule& rule) {
  const double v    = rule.then_value();
  const bool   pct  = rule.then_mode() == PRICE_MODE_PERCENTAGE;
  double       next = 0.0;

  if (rule.then_mode() != PRICE_MODE_FIXED && rule.then_mode() != PRICE_MODE_PERCENTAGE) {
    throw repricer::util::InvalidArgument("rule " + rule.id() + ": price mode is unspecified");
  }

  switch (rule.then_action()) {
    case PRICE_ACTION_INCREASE:
      next = pct ? current * (1.0 + v / 100.0) : current + v;
      break;
    case PRICE_ACTION_DECREASE:
      next = pct ? current * (1.0 - v / 100.0) : current - v;
      break;
    case PRICE_ACTION_SET:
      next = pct ? current * (v / 100.0) : v;
      break;
    default:
      throw repricer::util::InvalidArgument("rule " + rule.id() + ": price action is unspecified");
  }

  return RoundToCents(std::max(0.0, next));
}

std::optional<double> ComputeCompareAt(std::optional<double> existing, double pre_change_price, const PricingRule& rule) {
  if (!rule.change_compare_at()) {
    return existing;
  }
  return ComputePrice(existing.value_or(pre_change_price), rule);
}

} // namespace repricer::rules
