#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace handoff::model {

/*
  Typed organization settings.

  Zero minutes/hours disable the matching deadline or threshold.
  An empty account means the organization default; account-specific
  settings win over the default when both exist.
*/

struct SlaSettings {
  bool     enabled            = false;
  uint32_t response_minutes   = 0;
  uint32_t resolution_minutes = 0;
  uint32_t escalation_minutes = 0;
  uint32_t auto_close_hours   = 0;

  std::string auto_close_message;
  std::string warning_message;

  std::vector<std::string> escalation_notify_ids;
};

struct ClientInactivitySettings {
  bool        reminder_enabled = false;
  uint32_t    reminder_minutes = 0;
  std::string reminder_message;

  uint32_t    auto_close_minutes = 0;
  std::string auto_close_message;
};

struct BusinessDay {
  int  weekday      = 0; // 0 = Sunday
  bool enabled      = false;
  int  open_minute  = 0; // minutes since local midnight
  int  close_minute = 0; // exclusive
};

struct BusinessHours {
  bool                     enabled = false;
  std::string              out_of_hours_message;
  int                      utc_offset_minutes = 0;
  std::vector<BusinessDay> days;
};

struct OrganizationSettings {
  std::string organization_id;
  std::string account;

  bool assign_to_same_agent     = false;
  bool allow_agent_queue_pickup = true;
  bool mask_phone_numbers       = false;

  SlaSettings              sla;
  ClientInactivitySettings client_inactivity;
  BusinessHours            business_hours;

  uint64_t updated_at_ms = 0;
};

// built-in defaults used when an organization has no settings row
OrganizationSettings DefaultSettings(const std::string& organization_id);

// true if any scheduler step would run for these settings
bool NeedsScheduling(const OrganizationSettings& settings);

} // namespace handoff::model
