#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/routing/assignment_strategy.hpp"
#include "internal/settings/settings_cache.hpp"
#include "internal/transfer/transfer_queue.hpp"
#include "internal/util/uuid.hpp"
#include "support/fixtures.hpp"

namespace {

using handoff::db::memory::MemoryRepository;
using handoff::model::AssignmentStrategy;
using handoff::model::TeamRole;
using handoff::routing::AgentSelector;
using namespace handoff::testing;
using namespace std::chrono_literals;

std::optional<std::string> Select(MemoryRepository& repo, AgentSelector& selector, const std::string& team) {
  auto tx     = repo.Begin();
  auto chosen = selector.SelectAgent(*tx, team, kOrg);
  tx->Commit();
  return chosen;
}

void InsertActiveTransferFor(MemoryRepository& repo, const std::string& agent_id) {
  handoff::db::model::TransferRecord t;
  t.id              = handoff::util::NewId();
  t.organization_id = kOrg;
  t.contact_id      = SeedContact(repo, kOrg);
  t.agent_id        = agent_id;

  auto tx = repo.Begin();
  assert(repo.InsertTransfer(*tx, t));
  tx->Commit();
}

void TestRoundRobinVisitsEveryAgentOnce() {
  auto      repo = std::make_shared<MemoryRepository>();
  FakeClock clock;
  AgentSelector selector(repo, clock.Fn());

  const auto team = SeedTeam(*repo, kOrg, AssignmentStrategy::kRoundRobin);
  std::vector<std::string> agents;
  for (int i = 0; i < 3; ++i) {
    agents.push_back(SeedUser(*repo, kOrg));
    AddMember(*repo, team, agents.back());
  }

  std::set<std::string> seen;
  for (int i = 0; i < 3; ++i) {
    clock.AdvanceMinutes(1);
    auto chosen = Select(*repo, selector, team);
    assert(chosen);
    seen.insert(*chosen);
  }
  assert(seen.size() == 3);

  // the least recently assigned agent comes back first
  clock.AdvanceMinutes(1);
  assert(Select(*repo, selector, team) == agents[0]);
}

void TestRoundRobinSkipsUnavailableAndManagers() {
  auto          repo = std::make_shared<MemoryRepository>();
  AgentSelector selector(repo);

  const auto team     = SeedTeam(*repo, kOrg);
  const auto away     = SeedUser(*repo, kOrg, handoff::v1::ROLE_AGENT, /*available=*/false);
  const auto inactive = SeedUser(*repo, kOrg, handoff::v1::ROLE_AGENT, true, /*active=*/false);
  const auto manager  = SeedUser(*repo, kOrg, handoff::v1::ROLE_MANAGER);
  const auto ready    = SeedUser(*repo, kOrg);

  AddMember(*repo, team, away);
  AddMember(*repo, team, inactive);
  AddMember(*repo, team, manager, TeamRole::kManager);
  AddMember(*repo, team, ready, TeamRole::kAgent, /*last_assigned_at_ms=*/999);

  assert(Select(*repo, selector, team) == ready);
}

void TestLoadBalancedPicksLeastLoaded() {
  auto          repo = std::make_shared<MemoryRepository>();
  AgentSelector selector(repo);

  const auto team  = SeedTeam(*repo, kOrg, AssignmentStrategy::kLoadBalanced);
  const auto busy  = SeedUser(*repo, kOrg);
  const auto light = SeedUser(*repo, kOrg);
  AddMember(*repo, team, busy);
  AddMember(*repo, team, light);

  InsertActiveTransferFor(*repo, busy);
  InsertActiveTransferFor(*repo, busy);
  InsertActiveTransferFor(*repo, light);

  assert(Select(*repo, selector, team) == light);
}

void TestLoadBalancedTieGoesToFirstMember() {
  auto          repo = std::make_shared<MemoryRepository>();
  AgentSelector selector(repo);

  const auto team   = SeedTeam(*repo, kOrg, AssignmentStrategy::kLoadBalanced);
  const auto first  = SeedUser(*repo, kOrg);
  const auto second = SeedUser(*repo, kOrg);
  AddMember(*repo, team, first);
  AddMember(*repo, team, second);

  assert(Select(*repo, selector, team) == first);
}

void TestManualAndInactiveTeamsNeverSelect() {
  auto          repo = std::make_shared<MemoryRepository>();
  AgentSelector selector(repo);

  const auto manual   = SeedTeam(*repo, kOrg, AssignmentStrategy::kManual);
  const auto inactive = SeedTeam(*repo, kOrg, AssignmentStrategy::kRoundRobin, /*active=*/false);
  const auto agent    = SeedUser(*repo, kOrg);
  AddMember(*repo, manual, agent);
  AddMember(*repo, inactive, agent);

  assert(!Select(*repo, selector, manual));
  assert(!Select(*repo, selector, inactive));
  assert(!Select(*repo, selector, handoff::util::NewId()));
}

uint64_t LastAssignedAt(MemoryRepository& repo, const std::string& team, const std::string& user_id) {
  auto tx = repo.Begin();
  for (const auto& member : repo.ListTeamMembers(*tx, team)) {
    if (member.user_id == user_id) {
      return member.last_assigned_at_ms;
    }
  }
  return 0;
}

void TestAssignToTeamMovesCursor() {
  auto      repo = std::make_shared<MemoryRepository>();
  FakeClock clock;
  auto      notifier = std::make_shared<RecordingNotifier>();
  handoff::transfer::TransferQueue queue{repo, std::make_shared<handoff::settings::SettingsCache>(repo, 0ms, clock.Fn()),
                                         std::make_shared<AgentSelector>(repo, clock.Fn()),
                                         handoff::notify::Notifiers{notifier, notifier, std::make_shared<RecordingSender>()},
                                         clock.Fn()};

  const auto team   = SeedTeam(*repo, kOrg, AssignmentStrategy::kRoundRobin);
  const auto first  = SeedUser(*repo, kOrg);
  const auto second = SeedUser(*repo, kOrg);
  AddMember(*repo, team, first);
  AddMember(*repo, team, second);

  assert(queue.AssignToTeam(team, kOrg) == first);
  assert(LastAssignedAt(*repo, team, first) == clock.NowMs());
  assert(LastAssignedAt(*repo, team, second) == 0);

  clock.AdvanceMinutes(1);
  assert(queue.AssignToTeam(team, kOrg) == second);
  assert(LastAssignedAt(*repo, team, second) == clock.NowMs());

  const auto closed = SeedTeam(*repo, kOrg, AssignmentStrategy::kRoundRobin, /*active=*/false);
  AddMember(*repo, closed, first);
  assert(!queue.AssignToTeam(closed, kOrg));
  assert(LastAssignedAt(*repo, closed, first) == 0);
}

} // namespace

int main() {
  TestRoundRobinVisitsEveryAgentOnce();
  TestRoundRobinSkipsUnavailableAndManagers();
  TestLoadBalancedPicksLeastLoaded();
  TestLoadBalancedTieGoesToFirstMember();
  TestManualAndInactiveTeamsNeverSelect();
  TestAssignToTeamMovesCursor();

  std::cout << "handoff_unit_assignment_strategy: pass\n";
  return 0;
}
