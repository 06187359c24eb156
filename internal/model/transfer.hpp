#pragma once

#include <string>
#include <string_view>

#include "handoff/v1.hpp"

namespace handoff::model {

/*
  Text forms used by the SQL backends, logs and broadcast payloads.
  Parse* throw util::InvalidArgument on unknown text.
*/

std::string_view ToString(handoff::v1::TransferStatus status);
std::string_view ToString(handoff::v1::TransferSource source);
std::string_view ToString(handoff::v1::Role role);

handoff::v1::TransferStatus ParseTransferStatus(std::string_view text);
handoff::v1::TransferSource ParseTransferSource(std::string_view text);
handoff::v1::Role           ParseRole(std::string_view text);

// escalation level never exceeds this
inline constexpr int kMaxEscalationLevel = 2;

inline constexpr const char* kGeneralQueue = "general";

inline constexpr const char* kAutoCloseNote = "[Auto-closed: No agent response within SLA]";

} // namespace handoff::model
