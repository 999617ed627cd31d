#pragma once

#include <memory>

#include "internal/collaborators/collaborator_clients.hpp"
#include "internal/core/saga_definition.hpp"

namespace saga::sagas {

inline constexpr const char* kCreateOrderSagaType = "CreateOrderSaga";

namespace create_order_keys {
// protobuf JSON of saga.orchestrator.v1.OrderDraft
inline constexpr const char* kOrder          = "order";
inline constexpr const char* kReservationId  = "reservation_id";
inline constexpr const char* kTransactionId  = "transaction_id";
inline constexpr const char* kConfirmationId = "confirmation_id";
} // namespace create_order_keys

struct CreateOrderClients {
  std::shared_ptr<collaborators::InventoryClient> inventory;
  std::shared_ptr<collaborators::PaymentClient>   payment;
  std::shared_ptr<collaborators::OrderClient>     order;
};

/*
  ReserveInventory -> ProcessPayment -> ConfirmOrder.

  Compensation releases the reservation and refunds the payment;
  ConfirmOrder has nothing to undo.
*/
core::SagaDefinition BuildCreateOrderSaga(CreateOrderClients clients, core::RetryPolicy retry = {});

// Initial context for Orchestrator::Start.
core::ContextValues CreateOrderContext(const collaborators::v1::OrderDraft& draft);

// Throws util::InvalidState when the draft is missing or does not parse.
collaborators::v1::OrderDraft ReadOrderDraft(const core::ContextValues& context);

} // namespace saga::sagas
