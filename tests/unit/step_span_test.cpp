#include "internal/observability/spans.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using saga::observability::StepPhase;
using saga::observability::StepSpan;
using saga::observability::StepSpanInfo;

void TestSpanNamesFollowPhase() {
  static_assert(saga::observability::StepSpanName(StepPhase::kExecute) == "saga.step.execute");
  assert(saga::observability::StepSpanName(StepPhase::kCompensate) == "saga.step.compensate");
}

void TestSpanIsInertWithoutTracing() {
  const std::string execution_id = "exec-1";

  StepSpanInfo info;
  info.phase        = StepPhase::kCompensate;
  info.execution_id = execution_id;
  info.saga_type    = "CreateOrder";
  info.step         = "reserve_inventory";
  info.step_index   = 0;
  info.attempt      = 2;

  StepSpan span(info);
  assert(!span.Recording());
  span.Fail("terminal", "inventory rejected");
  assert(!span.Recording());
}

} // namespace

int main() {
  TestSpanNamesFollowPhase();
  TestSpanIsInertWithoutTracing();

  std::cout << "saga_orchestrator_unit_step_span: pass\n";
  return 0;
}
