#pragma once

#include <grpcpp/channel.h>

#include <memory>

#include "collaborator_clients.hpp"
#include "internal/remote/remote_call.hpp"
#include "internal/sagas/create_order_saga.hpp"
#include "config/config.pb.h"
#include "saga/orchestrator/v1_grpc.hpp"

namespace saga::collaborators {

class GrpcInventoryClient final : public InventoryClient {
 public:
  GrpcInventoryClient(std::shared_ptr<grpc::Channel> channel, std::unique_ptr<remote::RemoteCaller> caller);

  remote::CallResult Reserve(const v1::ReserveInventoryRequest& request, v1::ReserveInventoryResponse* response) override;
  remote::CallResult Release(const v1::ReleaseInventoryRequest& request, v1::ReleaseInventoryResponse* response) override;

 private:
  std::unique_ptr<v1::InventoryService::Stub> stub_;
  std::unique_ptr<remote::RemoteCaller>       caller_;
};

class GrpcPaymentClient final : public PaymentClient {
 public:
  GrpcPaymentClient(std::shared_ptr<grpc::Channel> channel, std::unique_ptr<remote::RemoteCaller> caller);

  remote::CallResult Process(const v1::ProcessPaymentRequest& request, v1::ProcessPaymentResponse* response) override;
  remote::CallResult Refund(const v1::RefundPaymentRequest& request, v1::RefundPaymentResponse* response) override;

 private:
  std::unique_ptr<v1::PaymentService::Stub> stub_;
  std::unique_ptr<remote::RemoteCaller>     caller_;
};

class GrpcOrderClient final : public OrderClient {
 public:
  GrpcOrderClient(std::shared_ptr<grpc::Channel> channel, std::unique_ptr<remote::RemoteCaller> caller);

  remote::CallResult Confirm(const v1::ConfirmOrderRequest& request, v1::ConfirmOrderResponse* response) override;

 private:
  std::unique_ptr<v1::OrderService::Stub> stub_;
  std::unique_ptr<remote::RemoteCaller>   caller_;
};

// Insecure channels to the configured endpoints, one circuit breaker each.
sagas::CreateOrderClients BuildGrpcClients(const saga::runtime::config::CollaboratorsConfig& config);

} // namespace saga::collaborators
