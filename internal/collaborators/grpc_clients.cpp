#include "grpc_clients.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace saga::collaborators {

GrpcInventoryClient::GrpcInventoryClient(std::shared_ptr<grpc::Channel> channel, std::unique_ptr<remote::RemoteCaller> caller)
    : stub_(v1::InventoryService::NewStub(channel)), caller_(std::move(caller)) {
}

remote::CallResult GrpcInventoryClient::Reserve(const v1::ReserveInventoryRequest& request, v1::ReserveInventoryResponse* response) {
  return caller_->Call("ReserveInventory", [&](grpc::ClientContext& ctx) { return stub_->ReserveInventory(&ctx, request, response); });
}

remote::CallResult GrpcInventoryClient::Release(const v1::ReleaseInventoryRequest& request, v1::ReleaseInventoryResponse* response) {
  return caller_->Call("ReleaseInventory", [&](grpc::ClientContext& ctx) { return stub_->ReleaseInventory(&ctx, request, response); });
}

GrpcPaymentClient::GrpcPaymentClient(std::shared_ptr<grpc::Channel> channel, std::unique_ptr<remote::RemoteCaller> caller)
    : stub_(v1::PaymentService::NewStub(channel)), caller_(std::move(caller)) {
}

remote::CallResult GrpcPaymentClient::Process(const v1::ProcessPaymentRequest& request, v1::ProcessPaymentResponse* response) {
  return caller_->Call("ProcessPayment", [&](grpc::ClientContext& ctx) { return stub_->ProcessPayment(&ctx, request, response); });
}

remote::CallResult GrpcPaymentClient::Refund(const v1::RefundPaymentRequest& request, v1::RefundPaymentResponse* response) {
  return caller_->Call("RefundPayment", [&](grpc::ClientContext& ctx) { return stub_->RefundPayment(&ctx, request, response); });
}

GrpcOrderClient::GrpcOrderClient(std::shared_ptr<grpc::Channel> channel, std::unique_ptr<remote::RemoteCaller> caller)
    : stub_(v1::OrderService::NewStub(channel)), caller_(std::move(caller)) {
}

remote::CallResult GrpcOrderClient::Confirm(const v1::ConfirmOrderRequest& request, v1::ConfirmOrderResponse* response) {
  return caller_->Call("ConfirmOrder", [&](grpc::ClientContext& ctx) { return stub_->ConfirmOrder(&ctx, request, response); });
}

namespace {

std::shared_ptr<grpc::Channel> Channel(const std::string& name, const saga::runtime::config::CollaboratorConfig& config) {
  if (config.endpoint().empty()) throw std::invalid_argument("collaborators." + name + ".endpoint is required");
  SAGA_LOG_INFO("collaborator channel", {observability::StringField("name", name), observability::StringField("endpoint", config.endpoint())});
  return grpc::CreateChannel(config.endpoint(), grpc::InsecureChannelCredentials());
}

} // namespace

sagas::CreateOrderClients BuildGrpcClients(const saga::runtime::config::CollaboratorsConfig& config) {
  sagas::CreateOrderClients clients;
  clients.inventory = std::make_shared<GrpcInventoryClient>(Channel("inventory", config.inventory()),
                                                            remote::RemoteCaller::FromConfig("inventory", config.inventory()));
  clients.payment   = std::make_shared<GrpcPaymentClient>(Channel("payment", config.payment()),
                                                        remote::RemoteCaller::FromConfig("payment", config.payment()));
  clients.order     = std::make_shared<GrpcOrderClient>(Channel("order", config.order()),
                                                      remote::RemoteCaller::FromConfig("order", config.order()));
  return clients;
}

} // namespace saga::collaborators
