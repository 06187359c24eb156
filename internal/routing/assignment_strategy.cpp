#include "assignment_strategy.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace handoff::routing {

using handoff::observability::IntField;
using handoff::observability::StringField;

AgentSelector::AgentSelector(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

std::optional<std::string> AgentSelector::SelectAgent(db::Transaction& tx, const std::string& team_id, const std::string& organization_id) {
  auto team = repository_->GetTeam(tx, organization_id, team_id);
  if (!team || !team->is_active) {
    HANDOFF_LOG_WARN("team not found or inactive, leaving transfer queued", {StringField("team_id", team_id), StringField("org_id", organization_id)});
    return std::nullopt;
  }

  switch (team->strategy) {
    case model::AssignmentStrategy::kManual:
      return std::nullopt;
    case model::AssignmentStrategy::kLoadBalanced:
      return LoadBalanced(tx, team_id, organization_id);
    case model::AssignmentStrategy::kRoundRobin:
    default:
      return RoundRobin(tx, team_id, organization_id);
  }
}

std::vector<db::model::TeamMemberRecord> AgentSelector::Candidates(db::Transaction& tx, const std::string& team_id,
                                                                   const std::string& organization_id) {
  std::vector<db::model::TeamMemberRecord> out;
  for (auto& member : repository_->ListTeamMembers(tx, team_id)) {
    if (member.role != model::TeamRole::kAgent) {
      continue;
    }
    auto user = repository_->GetUser(tx, organization_id, member.user_id);
    if (!user || !user->is_active || !user->is_available) {
      continue;
    }
    out.push_back(std::move(member));
  }
  return out;
}

std::optional<std::string> AgentSelector::RoundRobin(db::Transaction& tx, const std::string& team_id, const std::string& organization_id) {
  auto candidates = Candidates(tx, team_id, organization_id);
  if (candidates.empty()) {
    HANDOFF_LOG_DEBUG("no available agents for round robin", {StringField("team_id", team_id)});
    return std::nullopt;
  }

  // 0 = never assigned, sorts first; stable keeps membership order on ties
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const auto& a, const auto& b) { return a.last_assigned_at_ms < b.last_assigned_at_ms; });

  const auto& selected = candidates.front();
  db::ThrowIfDbError(repository_->TouchMemberAssignment(tx, team_id, selected.user_id, util::ToUnixMillis(now_())),
                     "round robin cursor");

  HANDOFF_LOG_DEBUG("round robin selected agent", {StringField("team_id", team_id), StringField("user_id", selected.user_id)});
  return selected.user_id;
}

std::optional<std::string> AgentSelector::LoadBalanced(db::Transaction& tx, const std::string& team_id, const std::string& organization_id) {
  const auto candidates = Candidates(tx, team_id, organization_id);
  if (candidates.empty()) {
    HANDOFF_LOG_DEBUG("no available agents for load balancing", {StringField("team_id", team_id)});
    return std::nullopt;
  }

  std::optional<std::string> selected;
  uint64_t                   lowest = 0;
  for (const auto& member : candidates) {
    const auto load = repository_->CountActiveTransfersForAgent(tx, organization_id, member.user_id);
    if (!selected || load < lowest) {
      selected = member.user_id;
      lowest   = load;
    }
  }

  HANDOFF_LOG_DEBUG("load balanced selected agent",
                    {StringField("team_id", team_id), StringField("user_id", *selected), IntField("current_load", static_cast<int64_t>(lowest))});
  return selected;
}

} // namespace handoff::routing
