#pragma once

#include <string>

#include "handoff/v1.hpp"

namespace handoff::model {

/*
  Authenticated identity of the user issuing a queue operation.
  Authentication happens upstream; this core only authorizes.
*/
struct Caller {
  std::string       organization_id;
  std::string       user_id;
  handoff::v1::Role role = handoff::v1::ROLE_AGENT;

  bool IsAdmin() const {
    return role == handoff::v1::ROLE_ADMIN;
  }
  bool IsAgent() const {
    return role == handoff::v1::ROLE_AGENT;
  }
};

} // namespace handoff::model
