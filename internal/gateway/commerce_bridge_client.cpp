#include "internal/gateway/commerce_bridge_client.hpp"

#include <grpcpp/client_context.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace repricer::gateway {

namespace {

using namespace repricer::engine::services::v1;

void ThrowIfFailed(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return;
  }
  throw repricer::util::GatewayError(std::string(action) + " failed: " + status.error_message());
}

} // namespace

CommerceBridgeClient::CommerceBridgeClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(CommerceBridgeService::NewStub(std::move(channel))), timeout_(timeout) {
}

void CommerceBridgeClient::PrepareContext(::grpc::ClientContext* context) const {
  context->set_deadline(std::chrono::system_clock::now() + timeout_);
}

std::optional<repricer::engine::v1::VariantDetails> CommerceBridgeClient::GetVariant(const std::string& shop_domain,
                                                                                     const std::string& variant_id) {
  GetVariantRequest req;
  req.set_shop_domain(shop_domain);
  req.set_variant_id(variant_id);

  GetVariantResponse  resp;
  ::grpc::ClientContext context;
  PrepareContext(&context);
  ThrowIfFailed(stub_->GetVariant(&context, req, &resp), "GetVariant");

  if (!resp.found()) return std::nullopt;
  return resp.variant();
}

std::optional<repricer::engine::v1::VariantDetails> CommerceBridgeClient::GetVariantByInventoryItem(const std::string& shop_domain,
                                                                                                    const std::string& inventory_item_id) {
  GetVariantByInventoryItemRequest req;
  req.set_shop_domain(shop_domain);
  req.set_inventory_item_id(inventory_item_id);

  GetVariantResponse  resp;
  ::grpc::ClientContext context;
  PrepareContext(&context);
  ThrowIfFailed(stub_->GetVariantByInventoryItem(&context, req, &resp), "GetVariantByInventoryItem");

  if (!resp.found()) return std::nullopt;
  return resp.variant();
}

repricer::engine::v1::PriceUpdateResult CommerceBridgeClient::UpdateVariantPrice(const std::string& shop_domain, const std::string& product_id,
                                                                                 const std::string& variant_id, double price,
                                                                                 std::optional<double> compare_at_price) {
  UpdateVariantPriceRequest req;
  req.set_shop_domain(shop_domain);
  req.set_product_id(product_id);
  req.set_variant_id(variant_id);
  req.set_price(price);
  if (compare_at_price) req.set_compare_at_price(*compare_at_price);

  UpdateVariantPriceResponse resp;
  ::grpc::ClientContext        context;
  PrepareContext(&context);
  ThrowIfFailed(stub_->UpdateVariantPrice(&context, req, &resp), "UpdateVariantPrice");
  return resp.result();
}

} // namespace repricer::gateway
