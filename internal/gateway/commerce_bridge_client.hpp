#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "internal/gateway/commerce_gateway.hpp"
#include "repricer/services/v1/commerce_bridge_service.grpc.pb.h"

namespace repricer::gateway {

// CommerceGateway over the CommerceBridgeService gRPC API.
class CommerceBridgeClient final : public CommerceGateway {
 public:
  CommerceBridgeClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  std::optional<repricer::engine::v1::VariantDetails> GetVariant(const std::string& shop_domain, const std::string& variant_id) override;

  std::optional<repricer::engine::v1::VariantDetails> GetVariantByInventoryItem(const std::string& shop_domain,
                                                                               const std::string& inventory_item_id) override;

  repricer::engine::v1::PriceUpdateResult UpdateVariantPrice(const std::string& shop_domain, const std::string& product_id,
                                                             const std::string& variant_id, double price,
                                                             std::optional<double> compare_at_price) override;

 private:
  void PrepareContext(::grpc::ClientContext* context) const;

  std::unique_ptr<repricer::engine::services::v1::CommerceBridgeService::Stub> stub_;
  std::chrono::milliseconds                                                     timeout_;
};

} // namespace repricer::gateway
