#pragma once

#include <optional>
#include <string>

#include "repricer/engine/v1/variant.pb.h"

namespace repricer::gateway {

/*
  Commerce platform access used by the engine.

  Lookups return nullopt when the platform does not know the id.
  UpdateVariantPrice reports platform-side rejections in the result
  (success=false, errors); transport failures throw util::GatewayError.
*/
class CommerceGateway {
 public:
  virtual ~CommerceGateway() = default;

  virtual std::optional<repricer::engine::v1::VariantDetails> GetVariant(const std::string& shop_domain, const std::string& variant_id) = 0;

  virtual std::optional<repricer::engine::v1::VariantDetails> GetVariantByInventoryItem(const std::string& shop_domain,
                                                                                       const std::string& inventory_item_id) = 0;

  virtual repricer::engine::v1::PriceUpdateResult UpdateVariantPrice(const std::string& shop_domain, const std::string& product_id,
                                                                     const std::string& variant_id, double price,
                                                                     std::optional<double> compare_at_price) = 0;
};

} // namespace repricer::gateway
