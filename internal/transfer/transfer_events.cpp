#include "transfer_events.hpp"

#include "internal/model/transfer.hpp"
#include "internal/util/phone_mask.hpp"
#include "internal/util/time.hpp"

namespace handoff::transfer {

using notify::SetBool;
using notify::SetNumber;
using notify::SetString;

namespace {

void SetContact(notify::Payload& payload, const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, bool mask) {
  const auto& phone = contact.phone_number.empty() ? transfer.phone_number : contact.phone_number;
  SetString(payload, "contact_name", mask ? util::MaskIfPhoneNumber(contact.profile_name) : contact.profile_name);
  SetString(payload, "phone_number", mask ? util::MaskPhoneNumber(phone) : phone);
}

void SetOptional(notify::Payload& payload, std::string_view key, const std::optional<std::string>& value) {
  if (value) {
    SetString(payload, key, *value);
  }
}

} // namespace

notify::Payload CreatedPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, bool mask) {
  notify::Payload payload;
  SetString(payload, "id", transfer.id);
  SetString(payload, "contact_id", transfer.contact_id);
  SetContact(payload, transfer, contact, mask);
  SetString(payload, "account", transfer.account);
  SetString(payload, "status", model::ToString(transfer.status));
  SetString(payload, "source", model::ToString(transfer.source));
  SetString(payload, "notes", transfer.notes);
  SetString(payload, "transferred_at", util::FormatRfc3339(transfer.transferred_at_ms));
  SetOptional(payload, "agent_id", transfer.agent_id);
  SetOptional(payload, "team_id", transfer.team_id);
  return payload;
}

notify::Payload AssignedPayload(const db::model::TransferRecord& transfer) {
  notify::Payload payload;
  SetString(payload, "id", transfer.id);
  SetString(payload, "contact_id", transfer.contact_id);
  SetString(payload, "status", model::ToString(transfer.status));
  SetOptional(payload, "agent_id", transfer.agent_id);
  return payload;
}

notify::Payload ResumedPayload(const db::model::TransferRecord& transfer) {
  notify::Payload payload;
  SetString(payload, "id", transfer.id);
  SetString(payload, "contact_id", transfer.contact_id);
  SetString(payload, "status", model::ToString(transfer.status));
  if (transfer.resumed_at_ms != 0) {
    SetString(payload, "resumed_at", util::FormatRfc3339(transfer.resumed_at_ms));
  }
  SetOptional(payload, "resumed_by", transfer.resumed_by);
  return payload;
}

notify::Payload StatusPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, bool mask) {
  notify::Payload payload;
  SetString(payload, "id", transfer.id);
  SetString(payload, "contact_id", transfer.contact_id);
  SetContact(payload, transfer, contact, mask);
  SetString(payload, "status", model::ToString(transfer.status));
  SetNumber(payload, "escalation_level", transfer.escalation_level);
  SetBool(payload, "sla_breached", transfer.sla_breached);
  return payload;
}

notify::Payload EscalationPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, int level,
                                  const std::vector<std::string>& notify_ids, bool mask) {
  notify::Payload payload;
  SetString(payload, "transfer_id", transfer.id);
  SetString(payload, "contact_id", transfer.contact_id);
  SetContact(payload, transfer, contact, mask);
  SetNumber(payload, "escalation_level", level);
  SetString(payload, "level_name", level >= 2 ? "critical" : "warning");
  SetString(payload, "waiting_since", util::FormatRfc3339(transfer.transferred_at_ms));
  if (transfer.team_id) {
    SetString(payload, "team_id", *transfer.team_id);
  } else {
    notify::SetNull(payload, "team_id");
  }
  notify::SetStringList(payload, "escalation_notify_ids", notify_ids);
  return payload;
}

notify::Payload WebhookPayload(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact) {
  notify::Payload payload;
  SetString(payload, "transfer_id", transfer.id);
  SetString(payload, "contact_id", transfer.contact_id);
  SetString(payload, "contact_phone", contact.phone_number);
  SetString(payload, "contact_name", contact.profile_name);
  SetString(payload, "source", model::ToString(transfer.source));
  SetString(payload, "reason", transfer.notes);
  SetOptional(payload, "agent_id", transfer.agent_id);
  SetString(payload, "account", transfer.account);
  return payload;
}

} // namespace handoff::transfer
