#include <cassert>
#include <iostream>

#include "internal/model/state_machine.hpp"

namespace {

using namespace modelreg::model;
using namespace modelreg::registry::v1;

static_assert(CanTransition(VERSION_STATUS_ACTIVE, VERSION_STATUS_DEPRECATED));
static_assert(!CanTransition(VERSION_STATUS_ARCHIVED, VERSION_STATUS_ACTIVE));

void TestForwardTransitions() {
  assert(CanTransition(VERSION_STATUS_ACTIVE, VERSION_STATUS_DEPRECATED));
  assert(CanTransition(VERSION_STATUS_DEPRECATED, VERSION_STATUS_ARCHIVED));
  assert(CanTransition(VERSION_STATUS_ACTIVE, VERSION_STATUS_ARCHIVED));
}

void TestBackwardTransitionsAreRejected() {
  assert(!CanTransition(VERSION_STATUS_DEPRECATED, VERSION_STATUS_ACTIVE));
  assert(!CanTransition(VERSION_STATUS_ARCHIVED, VERSION_STATUS_DEPRECATED));
  assert(!CanTransition(VERSION_STATUS_ACTIVE, VERSION_STATUS_UNSPECIFIED));
}

void TestProductionOverlay() {
  assert(CanHoldProduction(VERSION_STATUS_ACTIVE));
  assert(CanHoldProduction(VERSION_STATUS_DEPRECATED));
  assert(!CanHoldProduction(VERSION_STATUS_ARCHIVED));
}

} // namespace

int main() {
  TestForwardTransitions();
  TestBackwardTransitionsAreRejected();
  TestProductionOverlay();

  std::cout << "model_registry_unit_state_machine: pass\n";
  return 0;
}
