#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace handoff::db::memory {

namespace {

// calls fn with the matching table of both states
template <typename S, typename Fn>
void VisitTables(S& a, S& b, Table table, Fn&& fn) {
  switch (table) {
    case Table::kUsers:
      fn(a.users, b.users);
      break;
    case Table::kTeams:
      fn(a.teams, b.teams);
      break;
    case Table::kTeamMembers:
      fn(a.team_members, b.team_members);
      break;
    case Table::kContacts:
      fn(a.contacts, b.contacts);
      break;
    case Table::kChatbotSessions:
      fn(a.chatbot_sessions, b.chatbot_sessions);
      break;
    case Table::kSettings:
      fn(a.settings, b.settings);
      break;
    case Table::kTransfers:
      fn(a.transfers, b.transfers);
      break;
    case Table::kOutbound:
      fn(a.outbound, b.outbound);
      break;
  }
}

template <typename Map>
uint64_t VersionOf(const Map& table, const std::string& key) {
  auto it = table.find(key);
  return it == table.end() ? 0 : it->second.version;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

uint64_t MemoryTransaction::WorkingVersion(Table table, const std::string& key) const {
  uint64_t version = 0;
  VisitTables(working_, working_, table, [&](const auto& t, const auto&) { version = VersionOf(t, key); });
  return version;
}

void MemoryTransaction::Touch(Table table, const std::string& key) {
  base_versions_.try_emplace({table, key}, WorkingVersion(table, key));
}

void MemoryTransaction::Rebase(Table table, const std::string& key, uint64_t version) {
  base_versions_[{table, key}] = version;
}

void MemoryTransaction::CheckVersions() const {
  for (const auto& [row_key, base] : base_versions_) {
    // claimed rows are re-validated by CheckClaims instead
    if (row_key.first == Table::kTransfers && claimed_.contains(row_key.second)) continue;

    uint64_t current = 0;
    VisitTables(repo_.committed_, repo_.committed_, row_key.first,
                [&](const auto& t, const auto&) { current = VersionOf(t, row_key.second); });
    if (current != base) {
      throw util::Aborted("transaction aborted: row was modified by a concurrent transaction");
    }
  }
}

void MemoryTransaction::CheckClaims() const {
  for (const auto& id : claimed_) {
    auto it = repo_.committed_.transfers.find(id);
    if (it == repo_.committed_.transfers.end()) {
      throw util::Aborted("transaction aborted: claimed transfer disappeared");
    }
    const auto& current = it->second.value;
    if (current.status != handoff::v1::TRANSFER_STATUS_ACTIVE || current.agent_id) {
      throw util::Aborted("transaction aborted: claimed transfer was taken by a concurrent transaction");
    }
  }
}

// Scheduler-owned columns written since the claim (breach flag, escalation
// level) are carried over; an earlier breach keeps its timestamp.
void MemoryTransaction::MergeClaims() {
  for (const auto& id : claimed_) {
    auto mine   = working_.transfers.find(id);
    auto theirs = repo_.committed_.transfers.find(id);
    if (mine == working_.transfers.end() || theirs == repo_.committed_.transfers.end()) continue;

    auto base = base_versions_.find({Table::kTransfers, id});
    if (base != base_versions_.end() && base->second == theirs->second.version) continue;

    auto&       w = mine->second.value;
    const auto& c = theirs->second.value;
    if (c.escalation_level > w.escalation_level) {
      w.escalation_level = c.escalation_level;
      w.escalated_at_ms  = c.escalated_at_ms;
    }
    if (c.sla_breached) {
      w.sla_breached       = true;
      w.sla_breached_at_ms = c.sla_breached_at_ms;
    }
  }
}

void MemoryTransaction::CheckActiveTransfers() const {
  for (const auto& [row_key, _] : base_versions_) {
    if (row_key.first != Table::kTransfers) continue;

    auto mine = working_.transfers.find(row_key.second);
    if (mine == working_.transfers.end()) continue;
    const auto& t = mine->second.value;
    if (t.status != handoff::v1::TRANSFER_STATUS_ACTIVE) continue;

    for (const auto& [id, row] : repo_.committed_.transfers) {
      if (id == t.id) continue;
      if (row.value.organization_id != t.organization_id || row.value.contact_id != t.contact_id) continue;
      if (row.value.status != handoff::v1::TRANSFER_STATUS_ACTIVE) continue;

      // the other row may be closed by this same transaction
      auto overridden = working_.transfers.find(id);
      if (base_versions_.contains({Table::kTransfers, id}) && overridden != working_.transfers.end() &&
          overridden->second.value.status != handoff::v1::TRANSFER_STATUS_ACTIVE) {
        continue;
      }
      throw util::Conflict("contact already has an active transfer");
    }
  }
}

void MemoryTransaction::Apply() {
  for (const auto& [row_key, _] : base_versions_) {
    const auto& key = row_key.second;
    VisitTables(working_, repo_.committed_, row_key.first, [&](auto& working, auto& committed) {
      auto it = working.find(key);
      if (it == working.end()) {
        committed.erase(key);
        return;
      }
      auto row    = it->second;
      row.version = VersionOf(committed, key) + 1;
      committed.insert_or_assign(key, std::move(row));
    });
  }
}

void MemoryTransaction::ReleaseClaims() {
  for (const auto& id : claimed_) {
    auto it = repo_.claims_.find(id);
    if (it != repo_.claims_.end() && it->second == this) {
      repo_.claims_.erase(it);
    }
  }
  claimed_.clear();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  try {
    CheckVersions();
    CheckClaims();
    CheckActiveTransfers();
  } catch (...) {
    ReleaseClaims();
    rolled_back_ = true;
    throw;
  }
  MergeClaims();
  Apply();
  ReleaseClaims();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  std::scoped_lock lock(repo_.mutex_);
  ReleaseClaims();
  rolled_back_ = true;
}

} // namespace handoff::db::memory
