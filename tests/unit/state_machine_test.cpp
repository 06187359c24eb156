#include <cassert>
#include <iostream>

#include "internal/model/state_machine.hpp"
#include "internal/model/transfer.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace handoff::v1;
using handoff::model::CanTransition;
using handoff::model::IsTerminal;

void TestActiveTransitions() {
  assert(CanTransition(TRANSFER_STATUS_ACTIVE, TRANSFER_STATUS_ACTIVE));
  assert(CanTransition(TRANSFER_STATUS_ACTIVE, TRANSFER_STATUS_RESUMED));
  assert(CanTransition(TRANSFER_STATUS_ACTIVE, TRANSFER_STATUS_EXPIRED));
  assert(!CanTransition(TRANSFER_STATUS_ACTIVE, TRANSFER_STATUS_UNSPECIFIED));
}

void TestTerminalStatesAreFinal() {
  assert(IsTerminal(TRANSFER_STATUS_RESUMED));
  assert(IsTerminal(TRANSFER_STATUS_EXPIRED));
  assert(!IsTerminal(TRANSFER_STATUS_ACTIVE));

  for (auto from : {TRANSFER_STATUS_RESUMED, TRANSFER_STATUS_EXPIRED}) {
    for (auto to : {TRANSFER_STATUS_ACTIVE, TRANSFER_STATUS_RESUMED, TRANSFER_STATUS_EXPIRED}) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestStatusTextRoundTrip() {
  assert(handoff::model::ToString(TRANSFER_STATUS_ACTIVE) == "active");
  assert(handoff::model::ParseTransferStatus("expired") == TRANSFER_STATUS_EXPIRED);
  assert(handoff::model::ParseTransferSource("keyword") == TRANSFER_SOURCE_KEYWORD);
  assert(handoff::model::ParseRole("manager") == ROLE_MANAGER);

  bool threw = false;
  try {
    handoff::model::ParseTransferStatus("closed");
  } catch (const handoff::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestActiveTransitions();
  TestTerminalStatesAreFinal();
  TestStatusTextRoundTrip();

  std::cout << "handoff_unit_state_machine: pass\n";
  return 0;
}
