#include "outbox_sender.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace handoff::notify {

using handoff::observability::IntField;
using handoff::observability::StringField;

OutboxMessageSender::OutboxMessageSender(std::shared_ptr<db::Repository> repository, std::shared_ptr<Broadcaster> broadcaster,
                                         std::shared_ptr<EventDispatcher> dispatcher, util::NowFn now)
    : repository_(std::move(repository)), broadcaster_(std::move(broadcaster)), dispatcher_(std::move(dispatcher)), now_(std::move(now)) {
}

SendResult OutboxMessageSender::Send(const std::string& account, const db::model::ContactRecord& contact, const std::string& content,
                                     const SendOptions& options) {
  if (content.empty()) {
    throw util::InvalidArgument("send message: content is empty");
  }

  db::model::OutboundMessageRecord record;
  record.organization_id = contact.organization_id;
  record.account         = account.empty() ? contact.account : account;
  record.contact_id      = contact.id;
  record.phone_number    = contact.phone_number;
  record.content         = content;
  record.created_at_ms   = util::ToUnixMillis(now_());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertOutboundMessage(*tx, record), "queue outbound message");
  tx->Commit();

  HANDOFF_LOG_DEBUG("outbound message queued", {StringField("contact_id", contact.id), IntField("message_id", static_cast<int64_t>(record.id))});

  if (options.broadcast && broadcaster_) {
    Payload payload;
    SetNumber(payload, "id", static_cast<double>(record.id));
    SetString(payload, "contact_id", record.contact_id);
    SetString(payload, "account", record.account);
    SetString(payload, "direction", "outgoing");
    SetString(payload, "content", record.content);
    broadcaster_->NotifyOrg(record.organization_id, "new_message", payload);
  }

  if (options.dispatch_webhook && dispatcher_) {
    Payload payload;
    SetString(payload, "contact_id", record.contact_id);
    SetString(payload, "contact_phone", record.phone_number);
    SetString(payload, "account", record.account);
    SetString(payload, "content", record.content);
    dispatcher_->Dispatch(record.organization_id, "message.sent", payload);
  }

  return SendResult{record.id};
}

} // namespace handoff::notify
