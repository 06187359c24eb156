#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace handoff::db::memory {

class MemoryTransaction;

/*
  Row wrapper: version is bumped on every committed write,
  seq preserves insertion order for enumeration.
*/
template <typename T>
struct Row {
  T        value;
  uint64_t version = 0;
  uint64_t seq     = 0;
};

enum class Table {
  kUsers,
  kTeams,
  kTeamMembers,
  kContacts,
  kChatbotSessions,
  kSettings,
  kTransfers,
  kOutbound,
};

/*
  In-process repository.

  Each transaction works on a snapshot and records the version of
  every row it writes. Commit fails with util::Aborted if any of
  those rows changed underneath it (first committer wins), and with
  util::Conflict if it would leave two active transfers for one
  contact.

  Queue claims consult committed state plus a claim table so that
  concurrent pickers skip each other's rows instead of colliding.
  Scheduler writes re-read the latest committed row and leave claimed
  rows alone; a claimed row is re-validated at commit rather than
  version-checked.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertUser(Transaction&, const model::UserRecord&) override;
  std::optional<model::UserRecord> GetUser(Transaction&, const std::string&, const std::string&) override;

  Result InsertTeam(Transaction&, const model::TeamRecord&) override;
  std::optional<model::TeamRecord> GetTeam(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::TeamRecord> ListTeams(Transaction&, const std::string&) override;
  Result InsertTeamMember(Transaction&, const model::TeamMemberRecord&) override;
  std::vector<model::TeamMemberRecord> ListTeamMembers(Transaction&, const std::string&) override;
  std::vector<std::string> ListUserTeamIds(Transaction&, const std::string&, const std::string&) override;
  Result TouchMemberAssignment(Transaction&, const std::string&, const std::string&, uint64_t) override;

  Result InsertContact(Transaction&, const model::ContactRecord&) override;
  std::optional<model::ContactRecord> GetContact(Transaction&, const std::string&, const std::string&) override;
  Result SetContactAssignee(Transaction&, const std::string&, const std::string&,
                            const std::optional<std::string>&) override;
  Result SetChatbotTracking(Transaction&, const std::string&, const std::string&, uint64_t, bool) override;
  Result MarkChatbotReminderSent(Transaction&, const std::string&, const std::string&, uint64_t) override;
  std::vector<model::ContactRecord> ListInactivityCandidates(Transaction&, const std::string&) override;

  Result InsertChatbotSession(Transaction&, const model::ChatbotSessionRecord&) override;
  std::vector<model::ChatbotSessionRecord> ListChatbotSessions(Transaction&, const std::string&,
                                                               const std::string&) override;
  Result CancelActiveChatbotSessions(Transaction&, const std::string&, const std::string&, uint64_t) override;

  Result UpsertSettings(Transaction&, const handoff::model::OrganizationSettings&) override;
  std::optional<handoff::model::OrganizationSettings> GetSettings(Transaction&, const std::string&,
                                                                  const std::string&) override;
  std::vector<handoff::model::OrganizationSettings> ListSlaEnabledSettings(Transaction&) override;

  Result InsertTransfer(Transaction&, const model::TransferRecord&) override;
  std::optional<model::TransferRecord> GetTransfer(Transaction&, const std::string&, const std::string&) override;
  std::optional<model::TransferRecord> FindActiveTransfer(Transaction&, const std::string&,
                                                          const std::string&) override;
  std::vector<model::TransferRecord> ListTransfers(Transaction&, const std::string&,
                                                   std::optional<handoff::v1::TransferStatus>) override;
  uint64_t CountActiveTransfersForAgent(Transaction&, const std::string&, const std::string&) override;
  Result UpdateActiveTransfer(Transaction&, const model::TransferRecord&) override;
  std::optional<model::TransferRecord> ClaimNextQueuedTransfer(Transaction&, const QueueScope&,
                                                               const std::string&) override;
  Result SetFirstResponse(Transaction&, const std::string&, const std::string&, uint64_t) override;

  std::vector<model::TransferRecord> ListExpiredTransfers(Transaction&, const std::string&, uint64_t) override;
  Result ExpireTransfer(Transaction&, const std::string&, uint64_t, const std::string&) override;
  std::vector<model::TransferRecord> ListEscalationDueTransfers(Transaction&, const std::string&,
                                                                uint64_t) override;
  Result EscalateTransfer(Transaction&, const std::string&, int, uint64_t, bool) override;
  Result MarkUnassignedBreached(Transaction&, const std::string&, uint64_t) override;

  Result InsertOutboundMessage(Transaction&, model::OutboundMessageRecord&) override;
  std::vector<model::OutboundMessageRecord> ListOutboundMessages(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, Row<model::UserRecord>>                   users;
    std::map<std::string, Row<model::TeamRecord>>                   teams;
    std::map<std::string, Row<model::TeamMemberRecord>>             team_members; // team#user
    std::map<std::string, Row<model::ContactRecord>>                contacts;
    std::map<std::string, Row<model::ChatbotSessionRecord>>         chatbot_sessions;
    std::map<std::string, Row<handoff::model::OrganizationSettings>> settings;    // org#account
    std::map<std::string, Row<model::TransferRecord>>               transfers;
    std::map<std::string, Row<model::OutboundMessageRecord>>        outbound;
  };

  std::optional<model::TransferRecord> LatestTransfer(MemoryTransaction& tx, const std::string& transfer_id);

  uint64_t NextSeq() {
    return next_seq_.fetch_add(1);
  }

  std::mutex mutex_;
  State      committed_;

  // transfer id -> transaction holding the claim
  std::unordered_map<std::string, const MemoryTransaction*> claims_;

  std::atomic<uint64_t> next_seq_{1};
  std::atomic<uint64_t> next_outbound_id_{1};
};

} // namespace handoff::db::memory
