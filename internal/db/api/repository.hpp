#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/chatbot_session_record.hpp"
#include "internal/db/model/contact_record.hpp"
#include "internal/db/model/outbound_message_record.hpp"
#include "internal/db/model/team_record.hpp"
#include "internal/db/model/transfer_record.hpp"
#include "internal/db/model/user_record.hpp"
#include "internal/model/settings.hpp"

namespace handoff::db {

/*
  Which unassigned transfers a picker may claim.

  any_team         every queue in the organization
  include_general  transfers with no team
  team_ids         transfers in one of these teams
*/
struct QueueScope {
  std::string              organization_id;
  bool                     any_team        = false;
  bool                     include_general = false;
  std::vector<std::string> team_ids;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - At most one active transfer per (organization, contact); a write
    that would break this fails with Conflict
  - ClaimNextQueuedTransfer never hands the same row to two
    transactions; rows claimed by an open transaction are skipped
  - Scheduler updates are guarded by status predicates so that a
    repeated tick is a no-op

  All timestamps are unix milliseconds, 0 = unset.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Users
  // ---------------------------------------------------------------------

  virtual Result InsertUser(Transaction&, const model::UserRecord&) = 0;

  virtual std::optional<model::UserRecord> GetUser(Transaction&, const std::string& organization_id,
                                                   const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // Teams
  // ---------------------------------------------------------------------

  virtual Result InsertTeam(Transaction&, const model::TeamRecord&) = 0;

  virtual std::optional<model::TeamRecord> GetTeam(Transaction&, const std::string& organization_id,
                                                   const std::string& team_id) = 0;

  virtual std::vector<model::TeamRecord> ListTeams(Transaction&, const std::string& organization_id) = 0;

  virtual Result InsertTeamMember(Transaction&, const model::TeamMemberRecord&) = 0;

  // enumeration order is insertion order
  virtual std::vector<model::TeamMemberRecord> ListTeamMembers(Transaction&, const std::string& team_id) = 0;

  virtual std::vector<std::string> ListUserTeamIds(Transaction&, const std::string& organization_id,
                                                   const std::string& user_id) = 0;

  virtual Result TouchMemberAssignment(Transaction&, const std::string& team_id, const std::string& user_id,
                                       uint64_t assigned_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Contacts
  // ---------------------------------------------------------------------

  virtual Result InsertContact(Transaction&, const model::ContactRecord&) = 0;

  virtual std::optional<model::ContactRecord> GetContact(Transaction&, const std::string& organization_id,
                                                         const std::string& contact_id) = 0;

  virtual Result SetContactAssignee(Transaction&, const std::string& organization_id,
                                    const std::string& contact_id,
                                    const std::optional<std::string>& user_id) = 0;

  virtual Result SetChatbotTracking(Transaction&, const std::string& organization_id,
                                    const std::string& contact_id, uint64_t last_message_at_ms,
                                    bool reminder_sent) = 0;

  // sets chatbot_reminder_sent only while chatbot_last_message_at still
  // equals last_message_at_ms; a newer chatbot message wins
  virtual Result MarkChatbotReminderSent(Transaction&, const std::string& organization_id,
                                         const std::string& contact_id, uint64_t last_message_at_ms) = 0;

  // contacts with chatbot tracking set and no active transfer
  virtual std::vector<model::ContactRecord> ListInactivityCandidates(Transaction&,
                                                                     const std::string& organization_id) = 0;

  // ---------------------------------------------------------------------
  // Chatbot sessions
  // ---------------------------------------------------------------------

  virtual Result InsertChatbotSession(Transaction&, const model::ChatbotSessionRecord&) = 0;

  virtual std::vector<model::ChatbotSessionRecord> ListChatbotSessions(Transaction&,
                                                                       const std::string& organization_id,
                                                                       const std::string& contact_id) = 0;

  virtual Result CancelActiveChatbotSessions(Transaction&, const std::string& organization_id,
                                             const std::string& contact_id, uint64_t cancelled_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Settings
  // ---------------------------------------------------------------------

  virtual Result UpsertSettings(Transaction&, const handoff::model::OrganizationSettings&) = 0;

  virtual std::optional<handoff::model::OrganizationSettings> GetSettings(Transaction&,
                                                                          const std::string& organization_id,
                                                                          const std::string& account) = 0;

  virtual std::vector<handoff::model::OrganizationSettings> ListSlaEnabledSettings(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Transfers
  // ---------------------------------------------------------------------

  virtual Result InsertTransfer(Transaction&, const model::TransferRecord&) = 0;

  virtual std::optional<model::TransferRecord> GetTransfer(Transaction&, const std::string& organization_id,
                                                           const std::string& transfer_id) = 0;

  virtual std::optional<model::TransferRecord> FindActiveTransfer(Transaction&,
                                                                  const std::string& organization_id,
                                                                  const std::string& contact_id) = 0;

  // FIFO by transferred_at
  virtual std::vector<model::TransferRecord> ListTransfers(
      Transaction&, const std::string& organization_id,
      std::optional<handoff::v1::TransferStatus> status) = 0;

  virtual uint64_t CountActiveTransfersForAgent(Transaction&, const std::string& organization_id,
                                                const std::string& agent_id) = 0;

  // full row write, only while the stored row is still active
  virtual Result UpdateActiveTransfer(Transaction&, const model::TransferRecord&) = 0;

  /*
    Claims the oldest active, unassigned transfer in scope for agent_id.
    Sets agent_id, and transferred_by when it was unset. Rows already
    claimed by another open transaction are skipped, never waited on.
  */
  virtual std::optional<model::TransferRecord> ClaimNextQueuedTransfer(Transaction&, const QueueScope& scope,
                                                                       const std::string& agent_id) = 0;

  // sets first_response_at only when unset
  virtual Result SetFirstResponse(Transaction&, const std::string& organization_id,
                                  const std::string& transfer_id, uint64_t at_ms) = 0;

  // ---------------------------------------------------------------------
  // SLA scheduler
  // ---------------------------------------------------------------------

  // active, expires_at set and < now
  virtual std::vector<model::TransferRecord> ListExpiredTransfers(Transaction&, const std::string& organization_id,
                                                                  uint64_t now_ms) = 0;

  // status=expired, resumed_at=now, notes replaced; guarded on active
  virtual Result ExpireTransfer(Transaction&, const std::string& transfer_id, uint64_t now_ms,
                                const std::string& notes) = 0;

  // active, escalation_at set and < now, level below the cap
  virtual std::vector<model::TransferRecord> ListEscalationDueTransfers(Transaction&,
                                                                        const std::string& organization_id,
                                                                        uint64_t now_ms) = 0;

  // level from_level -> from_level + 1; guarded on active and from_level
  virtual Result EscalateTransfer(Transaction&, const std::string& transfer_id, int from_level, uint64_t now_ms,
                                  bool mark_breached) = 0;

  // active, unassigned, not breached, response deadline < now
  virtual Result MarkUnassignedBreached(Transaction&, const std::string& organization_id, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Outbound messages
  // ---------------------------------------------------------------------

  virtual Result InsertOutboundMessage(Transaction&, model::OutboundMessageRecord&) = 0;

  virtual std::vector<model::OutboundMessageRecord> ListOutboundMessages(Transaction&,
                                                                         const std::string& organization_id) = 0;
};

} // namespace handoff::db
