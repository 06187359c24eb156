#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/caller.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/routing/assignment_strategy.hpp"
#include "internal/settings/settings_cache.hpp"
#include "internal/util/time.hpp"

namespace handoff::transfer {

struct CreateTransferParams {
  std::string                contact_id;
  std::string                account;
  std::optional<std::string> agent_id;
  std::optional<std::string> team_id;
  std::string                notes;
  v1::TransferSource         source = v1::TRANSFER_SOURCE_MANUAL;
};

// chatbot-driven creation (keyword rule, flow step)
struct AutomatedTransferParams {
  std::string                contact_id;
  std::string                account;
  v1::TransferSource         source = v1::TRANSFER_SOURCE_FLOW;
  std::optional<std::string> team_id;
  std::string                notes;
};

struct ListFilter {
  std::optional<v1::TransferStatus> status;
  // team id, or model::kGeneralQueue for transfers without a team
  std::optional<std::string> team_id;
};

struct TransferListing {
  std::vector<db::model::TransferRecord> transfers; // FIFO
  uint64_t                               general_queue_count = 0;
  std::map<std::string, uint64_t>        team_queue_counts;
};

/*
  Human-facing transfer operations.

  Every mutation runs in one repository transaction; broadcasts and
  webhook events go out only after the commit. Settings are resolved
  before a transaction opens.

  Errors: util::InvalidArgument, util::PermissionDenied, util::NotFound,
  util::Conflict, util::InvalidState; storage failures as
  std::runtime_error. An empty queue is not an error. Create and PickNext
  rerun their transaction when it loses a race with a concurrent writer;
  util::Aborted escapes only after repeated losses.
*/
class TransferQueue {
 public:
  TransferQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<settings::SettingsCache> settings,
                std::shared_ptr<routing::AgentSelector> selector, notify::Notifiers notifiers, util::NowFn now = util::Now);

  // Conflict when the contact already has an active transfer.
  db::model::TransferRecord Create(const model::Caller& caller, const CreateTransferParams& params);

  // nullopt when skipped: active transfer exists, or outside business hours
  std::optional<db::model::TransferRecord> CreateAutomated(const std::string& organization_id, const AutomatedTransferParams& params);

  // unset agent_id assigns the transfer to the caller
  db::model::TransferRecord Assign(const model::Caller& caller, const std::string& transfer_id,
                                   const std::optional<std::string>& agent_id);

  // oldest unassigned transfer in the caller's scope; nullopt when the queue is empty
  std::optional<db::model::TransferRecord> PickNext(const model::Caller& caller, const std::optional<std::string>& team_id);

  db::model::TransferRecord Resume(const model::Caller& caller, const std::string& transfer_id);

  TransferListing List(const model::Caller& caller, const ListFilter& filter);

  db::model::TransferRecord RecordFirstResponse(const model::Caller& caller, const std::string& transfer_id);

  // applies the team's strategy outside any other operation
  std::optional<std::string> AssignToTeam(const std::string& team_id, const std::string& organization_id);

  // chatbot sent a message: restart the client inactivity clock
  void TouchChatbotMessage(const std::string& organization_id, const std::string& contact_id);

  // client replied or was transferred: stop inactivity tracking
  void ClearChatbotTracking(const std::string& organization_id, const std::string& contact_id);

 private:
  db::model::TransferRecord                CreateOnce(const model::Caller& caller, const CreateTransferParams& params);
  std::optional<db::model::TransferRecord> CreateAutomatedOnce(const std::string& organization_id, const AutomatedTransferParams& params);
  std::optional<db::model::TransferRecord> PickNextOnce(const model::Caller& caller, const std::optional<std::string>& team_id);

  db::model::TransferRecord LoadTransfer(const std::string& organization_id, const std::string& transfer_id);

  std::optional<std::string> ReuseAssignedAgent(db::Transaction& tx, const model::OrganizationSettings& settings,
                                                const db::model::ContactRecord& contact);

  void RequireAvailableAgent(db::Transaction& tx, const std::string& organization_id, const std::string& agent_id);

  // insert plus contact assignment and chatbot session cancellation
  void InsertWithSideEffects(db::Transaction& tx, const db::model::TransferRecord& record, uint64_t now_ms);

  void PublishCreated(const db::model::TransferRecord& record, const db::model::ContactRecord& contact, bool mask);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<settings::SettingsCache> settings_;
  std::shared_ptr<routing::AgentSelector>  selector_;
  notify::Notifiers                        notifiers_;
  util::NowFn                              now_;
};

} // namespace handoff::transfer
