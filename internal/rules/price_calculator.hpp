#pragma once

#include <optional>

#include "repricer/engine/v1/campaign.pb.h"

namespace repricer::rules {

// Applies the rule's action to `current`. Never negative; rounded half
// away from zero to cents. Throws util::InvalidArgument for an
// unspecified action or mode.
double ComputePrice(double current, const repricer::engine::v1::PricingRule& rule);

// New compare-at value. When the rule does not touch compare-at the
// existing value is returned unchanged; otherwise the rule's formula is
// applied to the existing value, or to the pre-change price when there
// is none.
std::optional<double> ComputeCompareAt(std::optional<double> existing, double pre_change_price, const repricer::engine::v1::PricingRule& rule);

double RoundToCents(double value);

} // namespace repricer::rules
