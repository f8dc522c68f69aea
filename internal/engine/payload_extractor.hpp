#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/gateway/commerce_gateway.hpp"
#include "repricer/engine/v1/event.pb.h"
#include "repricer/engine/v1/variant.pb.h"

namespace repricer::engine {

inline constexpr const char* kTopicInventoryLevelsUpdate = "inventory_levels/update";
inline constexpr const char* kTopicInventoryItemsUpdate  = "inventory_items/update";
inline constexpr const char* kTopicProductsUpdate        = "products/update";
inline constexpr const char* kTopicProductsCreate        = "products/create";

enum class ExtractionStatus {
  kOk,
  kUnsupportedTopic,
  kFailed,
};

struct ExtractedVariant {
  std::string variant_id;
  std::string product_id;

  // Level carried by the event itself; overrides the platform quantity.
  std::optional<int64_t> inventory;

  // Set when extraction already had to ask the platform.
  std::optional<repricer::engine::v1::VariantDetails> details;
};

struct Extraction {
  ExtractionStatus status = ExtractionStatus::kFailed;
  ExtractedVariant variant;
  std::string      detail;
};

// Variant entry of a product payload as seen by the self-echo check.
struct PayloadVariant {
  std::string                variant_id;
  std::optional<std::string> updated_at;
};

/*
  Topic-specific extraction of the affected variant.

  Inventory topics resolve the variant through the gateway by
  inventory item; product topics read the first entry of `variants`.
  Platform numeric ids are converted to gid form
  (gid://shopify/ProductVariant/<id>).
*/
class PayloadExtractor {
 public:
  explicit PayloadExtractor(std::shared_ptr<gateway::CommerceGateway> gateway);

  Extraction Extract(const repricer::engine::v1::InventoryChangeEvent& event);

  static bool IsProductTopic(const std::string& topic);

  static std::vector<PayloadVariant> ProductVariants(const google::protobuf::Struct& payload);

  // "gid://shopify/<kind>/<id>"; values already in gid form are returned as is.
  static std::string ToGid(const std::string& kind, const std::string& id);

 private:
  Extraction FromInventoryItem(const std::string& shop, const std::string& inventory_item_id, std::optional<int64_t> inventory);
  Extraction FromProduct(const google::protobuf::Struct& payload);

  std::shared_ptr<gateway::CommerceGateway> gateway_;
};

} // namespace repricer::engine
