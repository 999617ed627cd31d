#pragma once

#include "saga/orchestrator/v1.hpp"

#include "saga/orchestrator/v1/inventory_service.grpc.pb.h"
#include "saga/orchestrator/v1/order_service.grpc.pb.h"
#include "saga/orchestrator/v1/payment_service.grpc.pb.h"
