#include "transfer.hpp"

#include "internal/util/errors.hpp"

namespace handoff::model {

using handoff::v1::Role;
using handoff::v1::TransferSource;
using handoff::v1::TransferStatus;

std::string_view ToString(TransferStatus status) {
  switch (status) {
    case handoff::v1::TRANSFER_STATUS_ACTIVE:
      return "active";
    case handoff::v1::TRANSFER_STATUS_RESUMED:
      return "resumed";
    case handoff::v1::TRANSFER_STATUS_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

std::string_view ToString(TransferSource source) {
  switch (source) {
    case handoff::v1::TRANSFER_SOURCE_MANUAL:
      return "manual";
    case handoff::v1::TRANSFER_SOURCE_FLOW:
      return "flow";
    case handoff::v1::TRANSFER_SOURCE_KEYWORD:
      return "keyword";
    default:
      return "unspecified";
  }
}

std::string_view ToString(Role role) {
  switch (role) {
    case handoff::v1::ROLE_AGENT:
      return "agent";
    case handoff::v1::ROLE_MANAGER:
      return "manager";
    case handoff::v1::ROLE_ADMIN:
      return "admin";
    default:
      return "unspecified";
  }
}

TransferStatus ParseTransferStatus(std::string_view text) {
  if (text == "active") return handoff::v1::TRANSFER_STATUS_ACTIVE;
  if (text == "resumed") return handoff::v1::TRANSFER_STATUS_RESUMED;
  if (text == "expired") return handoff::v1::TRANSFER_STATUS_EXPIRED;
  throw util::InvalidArgument("unknown transfer status: " + std::string(text));
}

TransferSource ParseTransferSource(std::string_view text) {
  if (text == "manual") return handoff::v1::TRANSFER_SOURCE_MANUAL;
  if (text == "flow") return handoff::v1::TRANSFER_SOURCE_FLOW;
  if (text == "keyword") return handoff::v1::TRANSFER_SOURCE_KEYWORD;
  throw util::InvalidArgument("unknown transfer source: " + std::string(text));
}

Role ParseRole(std::string_view text) {
  if (text == "agent") return handoff::v1::ROLE_AGENT;
  if (text == "manager") return handoff::v1::ROLE_MANAGER;
  if (text == "admin") return handoff::v1::ROLE_ADMIN;
  throw util::InvalidArgument("unknown role: " + std::string(text));
}

} // namespace handoff::model
