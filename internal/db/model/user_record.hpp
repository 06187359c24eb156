#pragma once

#include <string>

#include "handoff/v1.hpp"

namespace handoff::db::model {

struct UserRecord {
  std::string       id;
  std::string       organization_id;
  std::string       name;
  handoff::v1::Role role         = handoff::v1::ROLE_AGENT;
  bool              is_active    = true;
  bool              is_available = true;
};

} // namespace handoff::db::model
