#include "internal/engine/payload_extractor.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <utility>

#include "internal/util/errors.hpp"

namespace repricer::engine {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value* Field(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.has_null_value()) {
    return nullptr;
  }
  return &it->second;
}

// Webhook ids arrive as JSON numbers; Struct keeps them as doubles.
std::optional<std::string> IdField(const Struct& object, const std::string& key) {
  const auto* value = Field(object, key);
  if (value == nullptr) return std::nullopt;
  if (value->has_number_value()) {
    return fmt::format("{}", static_cast<int64_t>(value->number_value()));
  }
  if (value->has_string_value() && !value->string_value().empty()) {
    return value->string_value();
  }
  return std::nullopt;
}

std::optional<int64_t> IntField(const Struct& object, const std::string& key) {
  const auto* value = Field(object, key);
  if (value == nullptr || !value->has_number_value()) return std::nullopt;
  return static_cast<int64_t>(std::llround(value->number_value()));
}

Extraction Failed(std::string detail) {
  Extraction out;
  out.status = ExtractionStatus::kFailed;
  out.detail = std::move(detail);
  return out;
}

} // namespace

PayloadExtractor::PayloadExtractor(std::shared_ptr<gateway::CommerceGateway> gateway) : gateway_(std::move(gateway)) {
}

bool PayloadExtractor::IsProductTopic(const std::string& topic) {
  return topic == kTopicProductsUpdate || topic == kTopicProductsCreate;
}

std::string PayloadExtractor::ToGid(const std::string& kind, const std::string& id) {
  if (id.rfind("gid://", 0) == 0) {
    return id;
  }
  return "gid://shopify/" + kind + "/" + id;
}

std::vector<PayloadVariant> PayloadExtractor::ProductVariants(const Struct& payload) {
  std::vector<PayloadVariant> out;
  const auto*                 variants = Field(payload, "variants");
  if (variants == nullptr || !variants->has_list_value()) {
    return out;
  }

  for (const auto& entry : variants->list_value().values()) {
    if (!entry.has_struct_value()) continue;
    const auto& variant = entry.struct_value();
    auto        id      = IdField(variant, "id");
    if (!id) continue;

    PayloadVariant item;
    item.variant_id = ToGid("ProductVariant", *id);
    if (const auto* updated = Field(variant, "updated_at"); updated != nullptr && updated->has_string_value()) {
      item.updated_at = updated->string_value();
    }
    out.push_back(std::move(item));
  }
  return out;
}

Extraction PayloadExtractor::Extract(const repricer::engine::v1::InventoryChangeEvent& event) {
  const auto& topic   = event.topic();
  const auto& payload = event.payload();

  try {
    if (topic == kTopicInventoryLevelsUpdate) {
      auto item = IdField(payload, "inventory_item_id");
      if (!item) return Failed("missing inventory_item_id");
      return FromInventoryItem(event.shop_domain(), *item, IntField(payload, "available").value_or(0));
    }

    if (topic == kTopicInventoryItemsUpdate) {
      auto item = IdField(payload, "id");
      if (!item) return Failed("missing inventory item id");
      return FromInventoryItem(event.shop_domain(), *item, std::nullopt);
    }

    if (IsProductTopic(topic)) {
      return FromProduct(payload);
    }
  } catch (const repricer::util::GatewayError& ex) {
    return Failed(std::string("variant lookup failed: ") + ex.what());
  }

  Extraction out;
  out.status = ExtractionStatus::kUnsupportedTopic;
  out.detail = "unsupported topic " + topic;
  return out;
}

Extraction PayloadExtractor::FromInventoryItem(const std::string& shop, const std::string& inventory_item_id, std::optional<int64_t> inventory) {
  auto details = gateway_->GetVariantByInventoryItem(shop, ToGid("InventoryItem", inventory_item_id));
  if (!details) {
    return Failed("no variant for inventory item " + inventory_item_id);
  }

  Extraction out;
  out.status             = ExtractionStatus::kOk;
  out.variant.variant_id = details->variant_id();
  out.variant.product_id = details->product_id();
  out.variant.inventory  = inventory;
  out.variant.details    = std::move(details);
  return out;
}

Extraction PayloadExtractor::FromProduct(const Struct& payload) {
  const auto* variants = Field(payload, "variants");
  if (variants == nullptr || !variants->has_list_value() || variants->list_value().values_size() == 0) {
    return Failed("product payload has no variants");
  }

  const auto& first = variants->list_value().values(0);
  if (!first.has_struct_value()) {
    return Failed("malformed variant entry");
  }

  auto variant_id = IdField(first.struct_value(), "id");
  auto product_id = IdField(payload, "id");
  if (!variant_id || !product_id) {
    return Failed("product payload without ids");
  }

  Extraction out;
  out.status             = ExtractionStatus::kOk;
  out.variant.variant_id = ToGid("ProductVariant", *variant_id);
  out.variant.product_id = ToGid("Product", *product_id);
  out.variant.inventory  = IntField(first.struct_value(), "inventory_quantity").value_or(0);
  return out;
}

} // namespace repricer::engine
