#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/routing/assignment_strategy.hpp"
#include "internal/settings/settings_cache.hpp"
#include "internal/transfer/transfer_queue.hpp"
#include "support/fixtures.hpp"

namespace {

using handoff::db::memory::MemoryRepository;
using handoff::transfer::CreateTransferParams;
using handoff::transfer::TransferQueue;
using namespace handoff::testing;
using namespace std::chrono_literals;

constexpr int kPickers   = 16;
constexpr int kTransfers = 5;

void TestConcurrentPickersNeverShareATransfer() {
  auto      repo = std::make_shared<MemoryRepository>();
  FakeClock clock;
  auto      settings = std::make_shared<handoff::settings::SettingsCache>(repo, 1min, clock.Fn());
  auto      notifier = std::make_shared<RecordingNotifier>();
  TransferQueue queue(repo, settings, std::make_shared<handoff::routing::AgentSelector>(repo, clock.Fn()),
                      handoff::notify::Notifiers{notifier, notifier, nullptr}, clock.Fn());

  const auto admin = MakeCaller(kOrg, SeedUser(*repo, kOrg, handoff::v1::ROLE_ADMIN), handoff::v1::ROLE_ADMIN);
  for (int i = 0; i < kTransfers; ++i) {
    CreateTransferParams params;
    params.contact_id = SeedContact(*repo, kOrg);
    queue.Create(admin, params);
  }

  std::vector<handoff::model::Caller> agents;
  for (int i = 0; i < kPickers; ++i) {
    agents.push_back(MakeCaller(kOrg, SeedUser(*repo, kOrg), handoff::v1::ROLE_AGENT));
  }

  std::atomic<bool>        go{false};
  std::mutex               mutex;
  std::vector<std::string> picked;
  std::vector<std::thread> threads;
  for (const auto& agent : agents) {
    threads.emplace_back([&, agent] {
      while (!go.load()) std::this_thread::yield();
      auto claimed = queue.PickNext(agent, std::nullopt);
      if (claimed) {
        assert(claimed->agent_id == agent.user_id);
        std::lock_guard<std::mutex> lock(mutex);
        picked.push_back(claimed->id);
      }
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  assert(picked.size() == kTransfers);
  assert(std::set<std::string>(picked.begin(), picked.end()).size() == kTransfers);

  // every claim committed with its own picker
  for (const auto& id : picked) {
    const auto stored = LoadTransfer(*repo, kOrg, id);
    assert(stored && stored->agent_id);
  }
  assert(notifier->CountBroadcasts("agent_transfer_assign") == kTransfers);
}

} // namespace

int main() {
  TestConcurrentPickersNeverShareATransfer();

  std::cout << "handoff_unit_transfer_queue_concurrency: pass\n";
  return 0;
}
