#include "settings.hpp"

namespace handoff::model {

OrganizationSettings DefaultSettings(const std::string& organization_id) {
  OrganizationSettings settings;
  settings.organization_id = organization_id;
  return settings;
}

bool NeedsScheduling(const OrganizationSettings& settings) {
  const auto& sla = settings.sla;
  if (!sla.enabled) {
    return false;
  }
  return sla.auto_close_hours > 0 || sla.escalation_minutes > 0 || sla.response_minutes > 0 ||
         settings.client_inactivity.reminder_enabled;
}

} // namespace handoff::model
