#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace handoff::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction& t);

  std::shared_ptr<PgPool> pool_;
};

}
