#include "internal/engine/target_matcher.hpp"

#include <algorithm>
#include <cctype>

namespace repricer::engine {

namespace {

std::string IdTail(const std::string& id) {
  const auto slash = id.rfind('/');
  return slash == std::string::npos ? id : id.substr(slash + 1);
}

bool SameId(const std::string& a, const std::string& b) {
  return a == b || (!a.empty() && !b.empty() && IdTail(a) == IdTail(b));
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

template <typename List>
bool ContainsId(const List& list, const std::string& id) {
  return std::any_of(list.begin(), list.end(), [&](const std::string& entry) { return SameId(entry, id); });
}

template <typename List>
bool ContainsText(const List& list, const std::string& text) {
  return !text.empty() && std::any_of(list.begin(), list.end(), [&](const std::string& entry) { return EqualsIgnoreCase(entry, text); });
}

} // namespace

bool TargetCriteriaEmpty(const repricer::engine::v1::TargetCriteria& criteria) {
  return criteria.product_ids().empty() && criteria.variant_ids().empty() && criteria.collection_ids().empty() && criteria.tags().empty() &&
         criteria.vendors().empty() && criteria.product_types().empty();
}

bool TargetMatches(const repricer::engine::v1::TargetCriteria& criteria, const std::string& variant_id, const std::string& product_id,
                   const repricer::engine::v1::VariantDetails* details) {
  if (TargetCriteriaEmpty(criteria)) {
    return true;
  }
  if (ContainsId(criteria.product_ids(), product_id) || ContainsId(criteria.variant_ids(), variant_id)) {
    return true;
  }
  if (details == nullptr) {
    return false;
  }

  for (const auto& collection : details->collection_ids()) {
    if (ContainsId(criteria.collection_ids(), collection)) return true;
  }
  for (const auto& tag : details->tags()) {
    if (ContainsText(criteria.tags(), tag)) return true;
  }
  return ContainsText(criteria.vendors(), details->vendor()) || ContainsText(criteria.product_types(), details->product_type());
}

} // namespace repricer::engine
