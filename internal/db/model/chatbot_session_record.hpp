#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace handoff::db::model {

enum class ChatbotSessionStatus {
  kActive,
  kCompleted,
  kCancelled,
};

inline std::string_view ToString(ChatbotSessionStatus status) {
  switch (status) {
    case ChatbotSessionStatus::kCompleted:
      return "completed";
    case ChatbotSessionStatus::kCancelled:
      return "cancelled";
    default:
      return "active";
  }
}

inline ChatbotSessionStatus ParseChatbotSessionStatus(std::string_view text) {
  if (text == "completed") return ChatbotSessionStatus::kCompleted;
  if (text == "cancelled") return ChatbotSessionStatus::kCancelled;
  return ChatbotSessionStatus::kActive;
}

struct ChatbotSessionRecord {
  std::string          id;
  std::string          organization_id;
  std::string          contact_id;
  ChatbotSessionStatus status          = ChatbotSessionStatus::kActive;
  uint64_t             started_at_ms   = 0;
  uint64_t             completed_at_ms = 0;
};

} // namespace handoff::db::model
