#pragma once

#include "saga/orchestrator/v1/context.pb.h"
#include "saga/orchestrator/v1/inventory_service.pb.h"
#include "saga/orchestrator/v1/order_service.pb.h"
#include "saga/orchestrator/v1/payment_service.pb.h"
