#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace handoff::testing {

/*
  Repository that forwards every call to another one. Tests derive from
  it and override the calls they want to hook or break.
*/
class ForwardingRepository : public db::Repository {
 public:
  explicit ForwardingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertUser(db::Transaction& tx, const db::model::UserRecord& r) override {
    return inner_->InsertUser(tx, r);
  }
  std::optional<db::model::UserRecord> GetUser(db::Transaction& tx, const std::string& org, const std::string& id) override {
    return inner_->GetUser(tx, org, id);
  }

  db::Result InsertTeam(db::Transaction& tx, const db::model::TeamRecord& r) override {
    return inner_->InsertTeam(tx, r);
  }
  std::optional<db::model::TeamRecord> GetTeam(db::Transaction& tx, const std::string& org, const std::string& id) override {
    return inner_->GetTeam(tx, org, id);
  }
  std::vector<db::model::TeamRecord> ListTeams(db::Transaction& tx, const std::string& org) override {
    return inner_->ListTeams(tx, org);
  }
  db::Result InsertTeamMember(db::Transaction& tx, const db::model::TeamMemberRecord& r) override {
    return inner_->InsertTeamMember(tx, r);
  }
  std::vector<db::model::TeamMemberRecord> ListTeamMembers(db::Transaction& tx, const std::string& team_id) override {
    return inner_->ListTeamMembers(tx, team_id);
  }
  std::vector<std::string> ListUserTeamIds(db::Transaction& tx, const std::string& org, const std::string& user_id) override {
    return inner_->ListUserTeamIds(tx, org, user_id);
  }
  db::Result TouchMemberAssignment(db::Transaction& tx, const std::string& team_id, const std::string& user_id,
                                   uint64_t at_ms) override {
    return inner_->TouchMemberAssignment(tx, team_id, user_id, at_ms);
  }

  db::Result InsertContact(db::Transaction& tx, const db::model::ContactRecord& r) override {
    return inner_->InsertContact(tx, r);
  }
  std::optional<db::model::ContactRecord> GetContact(db::Transaction& tx, const std::string& org, const std::string& id) override {
    return inner_->GetContact(tx, org, id);
  }
  db::Result SetContactAssignee(db::Transaction& tx, const std::string& org, const std::string& id,
                                const std::optional<std::string>& user_id) override {
    return inner_->SetContactAssignee(tx, org, id, user_id);
  }
  db::Result SetChatbotTracking(db::Transaction& tx, const std::string& org, const std::string& id, uint64_t at_ms,
                                bool reminder_sent) override {
    return inner_->SetChatbotTracking(tx, org, id, at_ms, reminder_sent);
  }
  db::Result MarkChatbotReminderSent(db::Transaction& tx, const std::string& org, const std::string& id,
                                     uint64_t last_message_at_ms) override {
    return inner_->MarkChatbotReminderSent(tx, org, id, last_message_at_ms);
  }
  std::vector<db::model::ContactRecord> ListInactivityCandidates(db::Transaction& tx, const std::string& org) override {
    return inner_->ListInactivityCandidates(tx, org);
  }

  db::Result InsertChatbotSession(db::Transaction& tx, const db::model::ChatbotSessionRecord& r) override {
    return inner_->InsertChatbotSession(tx, r);
  }
  std::vector<db::model::ChatbotSessionRecord> ListChatbotSessions(db::Transaction& tx, const std::string& org,
                                                                   const std::string& contact_id) override {
    return inner_->ListChatbotSessions(tx, org, contact_id);
  }
  db::Result CancelActiveChatbotSessions(db::Transaction& tx, const std::string& org, const std::string& contact_id,
                                         uint64_t at_ms) override {
    return inner_->CancelActiveChatbotSessions(tx, org, contact_id, at_ms);
  }

  db::Result UpsertSettings(db::Transaction& tx, const model::OrganizationSettings& r) override {
    return inner_->UpsertSettings(tx, r);
  }
  std::optional<model::OrganizationSettings> GetSettings(db::Transaction& tx, const std::string& org,
                                                         const std::string& account) override {
    return inner_->GetSettings(tx, org, account);
  }
  std::vector<model::OrganizationSettings> ListSlaEnabledSettings(db::Transaction& tx) override {
    return inner_->ListSlaEnabledSettings(tx);
  }

  db::Result InsertTransfer(db::Transaction& tx, const db::model::TransferRecord& r) override {
    return inner_->InsertTransfer(tx, r);
  }
  std::optional<db::model::TransferRecord> GetTransfer(db::Transaction& tx, const std::string& org, const std::string& id) override {
    return inner_->GetTransfer(tx, org, id);
  }
  std::optional<db::model::TransferRecord> FindActiveTransfer(db::Transaction& tx, const std::string& org,
                                                              const std::string& contact_id) override {
    return inner_->FindActiveTransfer(tx, org, contact_id);
  }
  std::vector<db::model::TransferRecord> ListTransfers(db::Transaction& tx, const std::string& org,
                                                       std::optional<v1::TransferStatus> status) override {
    return inner_->ListTransfers(tx, org, status);
  }
  uint64_t CountActiveTransfersForAgent(db::Transaction& tx, const std::string& org, const std::string& agent_id) override {
    return inner_->CountActiveTransfersForAgent(tx, org, agent_id);
  }
  db::Result UpdateActiveTransfer(db::Transaction& tx, const db::model::TransferRecord& r) override {
    return inner_->UpdateActiveTransfer(tx, r);
  }
  std::optional<db::model::TransferRecord> ClaimNextQueuedTransfer(db::Transaction& tx, const db::QueueScope& scope,
                                                                   const std::string& agent_id) override {
    return inner_->ClaimNextQueuedTransfer(tx, scope, agent_id);
  }
  db::Result SetFirstResponse(db::Transaction& tx, const std::string& org, const std::string& id, uint64_t at_ms) override {
    return inner_->SetFirstResponse(tx, org, id, at_ms);
  }

  std::vector<db::model::TransferRecord> ListExpiredTransfers(db::Transaction& tx, const std::string& org, uint64_t now_ms) override {
    return inner_->ListExpiredTransfers(tx, org, now_ms);
  }
  db::Result ExpireTransfer(db::Transaction& tx, const std::string& id, uint64_t now_ms, const std::string& notes) override {
    return inner_->ExpireTransfer(tx, id, now_ms, notes);
  }
  std::vector<db::model::TransferRecord> ListEscalationDueTransfers(db::Transaction& tx, const std::string& org,
                                                                    uint64_t now_ms) override {
    return inner_->ListEscalationDueTransfers(tx, org, now_ms);
  }
  db::Result EscalateTransfer(db::Transaction& tx, const std::string& id, int from_level, uint64_t now_ms,
                              bool mark_breached) override {
    return inner_->EscalateTransfer(tx, id, from_level, now_ms, mark_breached);
  }
  db::Result MarkUnassignedBreached(db::Transaction& tx, const std::string& org, uint64_t now_ms) override {
    return inner_->MarkUnassignedBreached(tx, org, now_ms);
  }

  db::Result InsertOutboundMessage(db::Transaction& tx, db::model::OutboundMessageRecord& r) override {
    return inner_->InsertOutboundMessage(tx, r);
  }
  std::vector<db::model::OutboundMessageRecord> ListOutboundMessages(db::Transaction& tx, const std::string& org) override {
    return inner_->ListOutboundMessages(tx, org);
  }

 protected:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace handoff::testing
