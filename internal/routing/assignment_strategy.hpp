#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace handoff::routing {

/*
  Picks an agent for a team according to the team's strategy.

  Candidates are members with the agent role whose user is active and
  available, in membership order.

    round_robin    least recently assigned first (never assigned first),
                   the winner's cursor moves to now
    load_balanced  fewest active transfers in the organization,
                   first enumerated wins a tie
    manual         never selects

  Runs inside the caller's transaction and takes no locks of its own.
*/
class AgentSelector {
 public:
  explicit AgentSelector(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  // nullopt when the team is missing, inactive, manual or has no candidate
  std::optional<std::string> SelectAgent(db::Transaction& tx, const std::string& team_id, const std::string& organization_id);

 private:
  std::vector<db::model::TeamMemberRecord> Candidates(db::Transaction& tx, const std::string& team_id,
                                                      const std::string& organization_id);

  std::optional<std::string> RoundRobin(db::Transaction& tx, const std::string& team_id, const std::string& organization_id);
  std::optional<std::string> LoadBalanced(db::Transaction& tx, const std::string& team_id, const std::string& organization_id);

  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace handoff::routing
