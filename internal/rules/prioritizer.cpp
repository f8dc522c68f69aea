#include "internal/rules/prioritizer.hpp"

#include <algorithm>
#include <map>

namespace repricer::rules {

using namespace repricer::engine::v1;

std::vector<RuleMatch> Prioritize(std::vector<RuleMatch> matches) {
  std::map<int, std::vector<std::size_t>> slots_by_family;
  for (std::size_t i = 0; i < matches.size(); ++i) {
    slots_by_family[matches[i].rule.when_condition()].push_back(i);
  }

  std::vector<RuleMatch> ordered(matches.size());
  for (auto& [family, slots] : slots_by_family) {
    std::vector<std::size_t> members = slots;
    if (family == CONDITION_KIND_LESS_THAN) {
      std::stable_sort(members.begin(), members.end(),
                       [&](std::size_t a, std::size_t b) { return matches[a].rule.when_value() < matches[b].rule.when_value(); });
    } else if (family == CONDITION_KIND_GREATER_THAN) {
      std::stable_sort(members.begin(), members.end(),
                       [&](std::size_t a, std::size_t b) { return matches[a].rule.when_value() > matches[b].rule.when_value(); });
    }
    for (std::size_t k = 0; k < slots.size(); ++k) {
      ordered[slots[k]] = std::move(matches[members[k]]);
    }
  }
  return ordered;
}

} // namespace repricer::rules
