#include "create_order_saga.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace saga::sagas {

namespace keys = create_order_keys;
namespace v1   = collaborators::v1;

using core::StepCall;
using core::StepResult;
using observability::ExecutionField;
using observability::StringField;
using remote::CallOutcome;
using remote::CallResult;

namespace {

constexpr const char* kRefundReason = "Order cancelled - saga compensation";

StepResult ToStepResult(const CallResult& result, const std::string& what, core::ContextValues fragment = {}) {
  switch (result.outcome) {
    case CallOutcome::kOk:
      return StepResult::Ok(std::move(fragment));
    case CallOutcome::kRetryable:
      return StepResult::Retryable(what + " failed: " + result.message);
    case CallOutcome::kTerminal:
      return StepResult::Terminal(what + " rejected: " + result.message);
  }
  return StepResult::Retryable(what + " returned an unclassified result");
}

std::string Lookup(const core::ContextValues& context, const char* key) {
  auto it = context.find(key);
  return it == context.end() ? std::string() : it->second;
}

// ------------------------------------------------------------------
// ReserveInventory
// ------------------------------------------------------------------

StepResult ReserveInventory(collaborators::InventoryClient& inventory, const StepCall& call) {
  v1::OrderDraft draft;
  try {
    draft = ReadOrderDraft(call.context);
  } catch (const util::InvalidState& e) {
    return StepResult::Terminal(e.what());
  }

  v1::ReserveInventoryRequest request;
  request.set_idempotency_key(call.idempotency_key);
  request.set_order_id(draft.order_id());
  *request.mutable_items() = draft.items();

  v1::ReserveInventoryResponse response;
  const auto                   result = inventory.Reserve(request, &response);
  if (result.Is(grpc::StatusCode::FAILED_PRECONDITION)) return StepResult::Terminal("insufficient stock: " + result.message);
  return ToStepResult(result, "reserve inventory", {{keys::kReservationId, response.reservation_id()}});
}

StepResult ReleaseInventory(collaborators::InventoryClient& inventory, const StepCall& call) {
  if (call.execute_rejected) return StepResult::Ok();

  v1::ReleaseInventoryRequest request;
  request.set_idempotency_key(call.idempotency_key);
  const auto reservation_id = Lookup(call.context, keys::kReservationId);
  if (reservation_id.empty()) {
    request.set_reserve_idempotency_key(core::ExecuteKey(call.execution_id, call.step_index));
  } else {
    request.set_reservation_id(reservation_id);
  }

  v1::ReleaseInventoryResponse response;
  const auto                   result = inventory.Release(request, &response);
  if (result.Is(grpc::StatusCode::NOT_FOUND)) {
    SAGA_LOG_INFO("release found no reservation, treating as released",
                  {ExecutionField(call.execution_id), StringField("reservation_id", reservation_id)});
    return StepResult::Ok();
  }
  return ToStepResult(result, "release inventory");
}

// ------------------------------------------------------------------
// ProcessPayment
// ------------------------------------------------------------------

StepResult ProcessPayment(collaborators::PaymentClient& payment, const StepCall& call) {
  v1::OrderDraft draft;
  try {
    draft = ReadOrderDraft(call.context);
  } catch (const util::InvalidState& e) {
    return StepResult::Terminal(e.what());
  }

  v1::ProcessPaymentRequest request;
  request.set_idempotency_key(call.idempotency_key);
  request.set_order_id(draft.order_id());
  request.set_amount_cents(draft.amount_cents());
  request.set_currency(draft.currency().empty() ? "USD" : draft.currency());
  request.set_method(draft.payment_method());

  v1::ProcessPaymentResponse response;
  const auto                 result = payment.Process(request, &response);
  if (result.Is(grpc::StatusCode::FAILED_PRECONDITION)) return StepResult::Terminal("payment declined: " + result.message);
  return ToStepResult(result, "process payment", {{keys::kTransactionId, response.transaction_id()}});
}

StepResult RefundPayment(collaborators::PaymentClient& payment, const StepCall& call) {
  if (call.execute_rejected) return StepResult::Ok();

  v1::RefundPaymentRequest request;
  request.set_idempotency_key(call.idempotency_key);
  request.set_reason(kRefundReason);
  const auto transaction_id = Lookup(call.context, keys::kTransactionId);
  if (transaction_id.empty()) {
    request.set_payment_idempotency_key(core::ExecuteKey(call.execution_id, call.step_index));
  } else {
    request.set_transaction_id(transaction_id);
  }

  v1::RefundPaymentResponse response;
  const auto                result = payment.Refund(request, &response);
  if (result.Is(grpc::StatusCode::ALREADY_EXISTS)) return StepResult::Ok();
  // Refund by key: no payment was ever captured under it.
  if (transaction_id.empty() && result.Is(grpc::StatusCode::NOT_FOUND)) return StepResult::Ok();
  return ToStepResult(result, "refund payment");
}

// ------------------------------------------------------------------
// ConfirmOrder
// ------------------------------------------------------------------

StepResult ConfirmOrder(collaborators::OrderClient& orders, const StepCall& call) {
  v1::OrderDraft draft;
  try {
    draft = ReadOrderDraft(call.context);
  } catch (const util::InvalidState& e) {
    return StepResult::Terminal(e.what());
  }

  v1::ConfirmOrderRequest request;
  request.set_idempotency_key(call.idempotency_key);
  request.set_order_id(draft.order_id());
  request.set_reservation_id(Lookup(call.context, keys::kReservationId));
  request.set_transaction_id(Lookup(call.context, keys::kTransactionId));

  v1::ConfirmOrderResponse response;
  const auto               result = orders.Confirm(request, &response);
  return ToStepResult(result, "confirm order", {{keys::kConfirmationId, response.confirmation_id()}});
}

} // namespace

core::SagaDefinition BuildCreateOrderSaga(CreateOrderClients clients, core::RetryPolicy retry) {
  if (!clients.inventory || !clients.payment || !clients.order) {
    throw util::DefinitionError(std::string(kCreateOrderSagaType) + " requires inventory, payment and order clients");
  }

  auto inventory = clients.inventory;
  auto payment   = clients.payment;
  auto orders    = clients.order;

  std::vector<core::Step> steps;
  steps.push_back({"ReserveInventory", [inventory](const StepCall& call) { return ReserveInventory(*inventory, call); },
                   [inventory](const StepCall& call) { return ReleaseInventory(*inventory, call); }});
  steps.push_back({"ProcessPayment", [payment](const StepCall& call) { return ProcessPayment(*payment, call); },
                   [payment](const StepCall& call) { return RefundPayment(*payment, call); }});
  steps.push_back({"ConfirmOrder", [orders](const StepCall& call) { return ConfirmOrder(*orders, call); },
                   [](const StepCall&) { return StepResult::Ok(); }});

  return core::SagaDefinition(kCreateOrderSagaType, std::move(steps), retry);
}

core::ContextValues CreateOrderContext(const v1::OrderDraft& draft) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(draft, &json);
  if (!status.ok()) throw util::InvalidState("order draft does not serialize: " + status.ToString());
  return {{keys::kOrder, json}};
}

v1::OrderDraft ReadOrderDraft(const core::ContextValues& context) {
  auto it = context.find(keys::kOrder);
  if (it == context.end()) throw util::InvalidState("context has no order draft");

  v1::OrderDraft draft;
  const auto     status = google::protobuf::util::JsonStringToMessage(it->second, &draft);
  if (!status.ok()) throw util::InvalidState("order draft does not parse: " + status.ToString());
  return draft;
}

} // namespace saga::sagas
