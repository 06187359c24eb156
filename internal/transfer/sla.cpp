#include "sla.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace handoff::transfer {

using handoff::observability::StringField;

namespace {

constexpr uint64_t kMinuteMs = 60ull * 1000;
constexpr uint64_t kHourMs   = 60 * kMinuteMs;

} // namespace

void SetSLADeadlines(db::model::TransferRecord& transfer, const model::OrganizationSettings& settings, uint64_t now_ms) {
  const auto& sla = settings.sla;
  if (!sla.enabled) {
    return;
  }

  if (sla.response_minutes > 0) transfer.response_deadline_ms = now_ms + sla.response_minutes * kMinuteMs;
  if (sla.resolution_minutes > 0) transfer.resolution_deadline_ms = now_ms + sla.resolution_minutes * kMinuteMs;
  if (sla.escalation_minutes > 0) transfer.escalation_at_ms = now_ms + sla.escalation_minutes * kMinuteMs;
  if (sla.auto_close_hours > 0) transfer.expires_at_ms = now_ms + sla.auto_close_hours * kHourMs;

  HANDOFF_LOG_DEBUG("sla deadlines set", {StringField("transfer_id", transfer.id),
                                          StringField("response_deadline", util::FormatRfc3339(transfer.response_deadline_ms)),
                                          StringField("escalation_at", util::FormatRfc3339(transfer.escalation_at_ms)),
                                          StringField("expires_at", util::FormatRfc3339(transfer.expires_at_ms))});
}

void UpdateSLAOnPickup(db::model::TransferRecord& transfer, uint64_t now_ms) {
  transfer.picked_up_at_ms = now_ms;

  if (transfer.response_deadline_ms != 0 && now_ms > transfer.response_deadline_ms && !transfer.sla_breached) {
    transfer.sla_breached       = true;
    transfer.sla_breached_at_ms = now_ms;
  }
}

bool UpdateSLAOnFirstResponse(db::model::TransferRecord& transfer, uint64_t now_ms) {
  if (transfer.first_response_at_ms != 0) {
    return false;
  }
  transfer.first_response_at_ms = now_ms;
  return true;
}

} // namespace handoff::transfer
