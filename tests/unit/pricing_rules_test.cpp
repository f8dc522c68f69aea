#include <cassert>
#include <cmath>
#include <iostream>
#include <optional>
#include <vector>

#include "internal/rules/condition.hpp"
#include "internal/rules/price_calculator.hpp"
#include "internal/rules/prioritizer.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace repricer::engine::v1;
using repricer::rules::ComputeCompareAt;
using repricer::rules::ComputePrice;
using repricer::rules::Prioritize;
using repricer::rules::RuleMatch;
using repricer::testing::MakeRule;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

RuleMatch Match(const PricingRule& rule) {
  RuleMatch match;
  match.rule                      = rule;
  match.evaluation.should_execute = true;
  return match;
}

void TestPriceFormulas() {
  assert(Near(ComputePrice(25.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_PERCENTAGE, 10)), 27.5));
  assert(Near(ComputePrice(25.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_DECREASE, PRICE_MODE_FIXED, 10)), 15.0));
  assert(Near(ComputePrice(20.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 5)), 25.0));
  assert(Near(ComputePrice(40.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_DECREASE, PRICE_MODE_PERCENTAGE, 25)), 30.0));
  assert(Near(ComputePrice(40.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_SET, PRICE_MODE_FIXED, 12.5)), 12.5));
  assert(Near(ComputePrice(40.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_SET, PRICE_MODE_PERCENTAGE, 80)), 32.0));
}

void TestPriceIsFlooredAndRounded() {
  assert(Near(ComputePrice(5.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_DECREASE, PRICE_MODE_FIXED, 20)), 0.0));
  assert(Near(ComputePrice(10.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_DECREASE, PRICE_MODE_PERCENTAGE, 150)), 0.0));
  assert(Near(ComputePrice(19.99, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_PERCENTAGE, 15)), 22.99));
  assert(Near(ComputePrice(9.99, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_PERCENTAGE, 33)), 13.29));
  assert(Near(repricer::rules::RoundToCents(2.675000001), 2.68));
}

void TestUnspecifiedActionIsRejected() {
  bool thrown = false;
  try {
    ComputePrice(10.0, MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_UNSPECIFIED, PRICE_MODE_FIXED, 1));
  } catch (const repricer::util::InvalidArgument&) {
    thrown = true;
  }
  assert(thrown);
}

void TestCompareAt() {
  auto rule = MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 5);

  assert(!ComputeCompareAt(std::nullopt, 20.0, rule).has_value());
  assert(Near(*ComputeCompareAt(30.0, 20.0, rule), 30.0));

  rule.set_change_compare_at(true);
  assert(Near(*ComputeCompareAt(30.0, 20.0, rule), 35.0));
  assert(Near(*ComputeCompareAt(std::nullopt, 20.0, rule), 25.0));
}

void TestConditions() {
  const auto less    = MakeRule("r", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 1);
  const auto greater = MakeRule("r", CONDITION_KIND_GREATER_THAN, 100, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 1);
  const auto equals  = MakeRule("r", CONDITION_KIND_EQUALS, 0, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 1);

  assert(repricer::rules::Matches(less, 9));
  assert(!repricer::rules::Matches(less, 10));
  assert(repricer::rules::Matches(greater, 101));
  assert(!repricer::rules::Matches(greater, 100));
  assert(repricer::rules::Matches(equals, 0));
  assert(!repricer::rules::Matches(equals, 1));

  assert(repricer::rules::DescribeCondition(less) == "less_than 10");
  assert(repricer::rules::DescribeCondition(greater) == "greater_than 100");
}

void TestMoreSpecificLessThanWins() {
  std::vector<RuleMatch> matches;
  matches.push_back(Match(MakeRule("lt20", CONDITION_KIND_LESS_THAN, 20, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 1)));
  matches.push_back(Match(MakeRule("lt10", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 2)));

  const auto ordered = Prioritize(std::move(matches));
  assert(ordered.size() == 2);
  assert(ordered[0].rule.id() == "lt10");
  assert(ordered[1].rule.id() == "lt20");
}

void TestMoreSpecificGreaterThanWins() {
  std::vector<RuleMatch> matches;
  matches.push_back(Match(MakeRule("gt50", CONDITION_KIND_GREATER_THAN, 50, PRICE_ACTION_DECREASE, PRICE_MODE_FIXED, 1)));
  matches.push_back(Match(MakeRule("gt100", CONDITION_KIND_GREATER_THAN, 100, PRICE_ACTION_DECREASE, PRICE_MODE_FIXED, 2)));

  const auto ordered = Prioritize(std::move(matches));
  assert(ordered[0].rule.id() == "gt100");
}

void TestFamiliesKeepDeclarationOrder() {
  std::vector<RuleMatch> matches;
  matches.push_back(Match(MakeRule("eq5", CONDITION_KIND_EQUALS, 5, PRICE_ACTION_SET, PRICE_MODE_FIXED, 9)));
  matches.push_back(Match(MakeRule("lt20", CONDITION_KIND_LESS_THAN, 20, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 1)));
  matches.push_back(Match(MakeRule("lt10", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 2)));
  matches.push_back(Match(MakeRule("lt10b", CONDITION_KIND_LESS_THAN, 10, PRICE_ACTION_INCREASE, PRICE_MODE_FIXED, 3)));

  const auto ordered = Prioritize(std::move(matches));
  assert(ordered[0].rule.id() == "eq5");
  assert(ordered[1].rule.id() == "lt10");
  assert(ordered[2].rule.id() == "lt10b");
  assert(ordered[3].rule.id() == "lt20");
}

} // namespace

int main() {
  TestPriceFormulas();
  TestPriceIsFlooredAndRounded();
  TestUnspecifiedActionIsRejected();
  TestCompareAt();
  TestConditions();
  TestMoreSpecificLessThanWins();
  TestMoreSpecificGreaterThanWins();
  TestFamiliesKeepDeclarationOrder();

  std::cout << "repricer_unit_pricing_rules: pass\n";
  return 0;
}
