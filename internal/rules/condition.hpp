#pragma once

#include <cstdint>
#include <string>

#include "repricer/engine/v1/campaign.pb.h"

namespace repricer::rules {

// Raw level check of the rule's condition against an inventory quantity.
bool Matches(const repricer::engine::v1::PricingRule& rule, int64_t inventory);

// "less_than 10" style text for reasons and logs.
std::string DescribeCondition(const repricer::engine::v1::PricingRule& rule);

} // namespace repricer::rules
