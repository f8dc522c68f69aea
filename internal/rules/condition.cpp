#include "internal/rules/condition.hpp"

#include <spdlog/fmt/fmt.h>

namespace repricer::rules {

using namespace repricer::engine::v1;

bool Matches(const PricingRule& rule, int64_t inventory) {
  const auto value = static_cast<double>(inventory);
  switch (rule.when_condition()) {
    case CONDITION_KIND_LESS_THAN:
      return value < rule.when_value();
    case CONDITION_KIND_GREATER_THAN:
      return value > rule.when_value();
    case CONDITION_KIND_EQUALS:
      return value == rule.when_value();
    default:
      return false;
  }
}

std::string DescribeCondition(const PricingRule& rule) {
  const char* op = "unknown";
  switch (rule.when_condition()) {
    case CONDITION_KIND_LESS_THAN:
      op = "less_than";
      break;
    case CONDITION_KIND_GREATER_THAN:
      op = "greater_than";
      break;
    case CONDITION_KIND_EQUALS:
      op = "equals";
      break;
    default:
      break;
  }
  return fmt::format("{} {:g}", op, rule.when_value());
}

} // namespace repricer::rules
