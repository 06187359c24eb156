#pragma once

#include <string>
#include <vector>

#include "internal/db/model/contact_record.hpp"
#include "internal/db/model/transfer_record.hpp"
#include "internal/notify/notifier.hpp"

namespace handoff::transfer {

// real-time event types
inline constexpr const char* kEventCreated    = "agent_transfer";
inline constexpr const char* kEventAssigned   = "agent_transfer_assign";
inline constexpr const char* kEventResumed    = "agent_transfer_resume";
inline constexpr const char* kEventExpired    = "transfer_expired";
inline constexpr const char* kEventEscalated  = "transfer_escalated";
inline constexpr const char* kEventEscalation = "transfer_escalation";

// webhook events
inline constexpr const char* kWebhookCreated  = "transfer.created";
inline constexpr const char* kWebhookAssigned = "transfer.assigned";
inline constexpr const char* kWebhookResumed  = "transfer.resumed";

/*
  Payload builders. With `mask` set the phone number keeps only its
  last four digits and a profile name that looks like a phone number
  is masked the same way.
*/

notify::Payload CreatedPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, bool mask);

notify::Payload AssignedPayload(const db::model::TransferRecord& transfer);

notify::Payload ResumedPayload(const db::model::TransferRecord& transfer);

// scheduler status change (expired / escalated)
notify::Payload StatusPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, bool mask);

// level_name is "warning" at level 1 and "critical" from level 2
notify::Payload EscalationPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, int level,
                                  const std::vector<std::string>& notify_ids, bool mask);

notify::Payload WebhookPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact);

} // namespace handoff::transfer
