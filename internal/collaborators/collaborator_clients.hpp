#pragma once

#include "internal/remote/call_result.hpp"
#include "saga/orchestrator/v1.hpp"

namespace saga::collaborators {

namespace v1 = saga::orchestrator::v1;

/*
  Request/response contracts of the services the create-order saga talks
  to. Each call is a single attempt; implementations wrap it with the
  remote call adapter.
*/

class InventoryClient {
 public:
  virtual ~InventoryClient() = default;

  virtual remote::CallResult Reserve(const v1::ReserveInventoryRequest& request, v1::ReserveInventoryResponse* response) = 0;
  virtual remote::CallResult Release(const v1::ReleaseInventoryRequest& request, v1::ReleaseInventoryResponse* response) = 0;
};

class PaymentClient {
 public:
  virtual ~PaymentClient() = default;

  virtual remote::CallResult Process(const v1::ProcessPaymentRequest& request, v1::ProcessPaymentResponse* response) = 0;
  virtual remote::CallResult Refund(const v1::RefundPaymentRequest& request, v1::RefundPaymentResponse* response) = 0;
};

class OrderClient {
 public:
  virtual ~OrderClient() = default;

  virtual remote::CallResult Confirm(const v1::ConfirmOrderRequest& request, v1::ConfirmOrderResponse* response) = 0;
};

} // namespace saga::collaborators
