#pragma once

#include "handoff/v1.hpp"

namespace handoff::model {

/*
  Transfer lifecycle.

    active -> active    (assign, pick, escalate)
    active -> resumed   (resume)
    active -> expired   (auto-close)

  resumed and expired are terminal.
*/

constexpr bool IsTerminal(handoff::v1::TransferStatus status) {
  return status == handoff::v1::TRANSFER_STATUS_RESUMED || status == handoff::v1::TRANSFER_STATUS_EXPIRED;
}

constexpr bool CanTransition(handoff::v1::TransferStatus from, handoff::v1::TransferStatus to) {
  if (from != handoff::v1::TRANSFER_STATUS_ACTIVE) {
    return false;
  }
  return to == handoff::v1::TRANSFER_STATUS_ACTIVE || IsTerminal(to);
}

} // namespace handoff::model
