#pragma once

#include <string_view>

namespace handoff::model {

enum class AssignmentStrategy {
  kRoundRobin,
  kLoadBalanced,
  kManual,
};

enum class TeamRole {
  kAgent,
  kManager,
};

// unknown or empty strategy text falls back to round robin
inline AssignmentStrategy ParseAssignmentStrategy(std::string_view text) {
  if (text == "load_balanced") return AssignmentStrategy::kLoadBalanced;
  if (text == "manual") return AssignmentStrategy::kManual;
  return AssignmentStrategy::kRoundRobin;
}

inline std::string_view ToString(AssignmentStrategy strategy) {
  switch (strategy) {
    case AssignmentStrategy::kLoadBalanced:
      return "load_balanced";
    case AssignmentStrategy::kManual:
      return "manual";
    default:
      return "round_robin";
  }
}

inline TeamRole ParseTeamRole(std::string_view text) {
  return text == "manager" ? TeamRole::kManager : TeamRole::kAgent;
}

inline std::string_view ToString(TeamRole role) {
  return role == TeamRole::kManager ? "manager" : "agent";
}

} // namespace handoff::model
