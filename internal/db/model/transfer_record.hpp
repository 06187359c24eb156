#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "handoff/v1.hpp"

namespace handoff::db::model {

/*
  Persistent transfer row.

  The transfer is the single owner of its SLA state.
  All *_ms fields are unix milliseconds, 0 = unset.
*/

struct TransferRecord {
  std::string id;
  std::string organization_id;
  std::string contact_id;
  std::string account;
  std::string phone_number;

  handoff::v1::TransferStatus status = handoff::v1::TRANSFER_STATUS_ACTIVE;
  handoff::v1::TransferSource source = handoff::v1::TRANSFER_SOURCE_MANUAL;

  std::optional<std::string> agent_id;
  std::optional<std::string> team_id;
  std::optional<std::string> transferred_by;

  std::string notes;

  uint64_t                   transferred_at_ms = 0; // queue FIFO key
  uint64_t                   resumed_at_ms     = 0;
  std::optional<std::string> resumed_by;

  // SLA
  uint64_t response_deadline_ms   = 0;
  uint64_t resolution_deadline_ms = 0;
  uint64_t escalation_at_ms       = 0;
  uint64_t expires_at_ms          = 0;
  bool     sla_breached           = false;
  uint64_t sla_breached_at_ms     = 0;
  int      escalation_level       = 0;
  uint64_t escalated_at_ms        = 0;
  uint64_t picked_up_at_ms        = 0;
  uint64_t first_response_at_ms   = 0;
};

} // namespace handoff::db::model
