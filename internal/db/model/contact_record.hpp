#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace handoff::db::model {

struct ContactRecord {
  std::string id;
  std::string organization_id;
  std::string phone_number;
  std::string profile_name;
  std::string account;

  std::optional<std::string> assigned_user_id;

  // chatbot inactivity tracking, independent of transfers
  uint64_t chatbot_last_message_at_ms = 0;
  bool     chatbot_reminder_sent      = false;
};

} // namespace handoff::db::model
