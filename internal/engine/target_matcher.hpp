#pragma once

#include <string>

#include "repricer/engine/v1/campaign.pb.h"
#include "repricer/engine/v1/variant.pb.h"

namespace repricer::engine {

/*
  Union match of campaign targets against a variant.

  Empty criteria target everything. Ids compare equal in gid or bare
  numeric form. Tags, vendors and product types compare
  case-insensitively and are only consulted when details are known.
*/
bool TargetMatches(const repricer::engine::v1::TargetCriteria& criteria, const std::string& variant_id, const std::string& product_id,
                   const repricer::engine::v1::VariantDetails* details);

bool TargetCriteriaEmpty(const repricer::engine::v1::TargetCriteria& criteria);

} // namespace repricer::engine
