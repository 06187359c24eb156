#pragma once

#include <cstdint>

#include "internal/db/model/transfer_record.hpp"
#include "internal/model/settings.hpp"

namespace handoff::transfer {

/*
  SLA bookkeeping on a transfer row. Pure functions over the record,
  persisting is the caller's job.
*/

// Deadlines relative to now_ms; nothing happens unless SLA is enabled.
// A zero threshold leaves the matching deadline unset.
void SetSLADeadlines(db::model::TransferRecord& transfer, const model::OrganizationSettings& settings, uint64_t now_ms);

// Stamps picked_up_at and flags a breach when the response deadline has
// passed. An existing breach keeps its original timestamp.
void UpdateSLAOnPickup(db::model::TransferRecord& transfer, uint64_t now_ms);

// Returns false when the first response was already recorded.
bool UpdateSLAOnFirstResponse(db::model::TransferRecord& transfer, uint64_t now_ms);

} // namespace handoff::transfer
