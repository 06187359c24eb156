#pragma once

#include <cstdint>
#include <string>

#include "internal/model/team.hpp"

namespace handoff::db::model {

struct TeamRecord {
  std::string                         id;
  std::string                         organization_id;
  std::string                         name;
  handoff::model::AssignmentStrategy strategy  = handoff::model::AssignmentStrategy::kRoundRobin;
  bool                                is_active = true;
};

/*
  (team, user) membership.
  last_assigned_at_ms is the round-robin cursor, 0 = never assigned.
*/
struct TeamMemberRecord {
  std::string              team_id;
  std::string              user_id;
  handoff::model::TeamRole role                = handoff::model::TeamRole::kAgent;
  uint64_t                 last_assigned_at_ms = 0;
};

} // namespace handoff::db::model
