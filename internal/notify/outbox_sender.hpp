#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "notifier.hpp"

namespace handoff::notify {

/*
  MessageSender that stores each text in outbound_messages for the
  channel client to pick up. The write is committed before Send
  returns, whatever options.async says.
*/
class OutboxMessageSender final : public MessageSender {
 public:
  OutboxMessageSender(std::shared_ptr<db::Repository> repository, std::shared_ptr<Broadcaster> broadcaster = nullptr,
                      std::shared_ptr<EventDispatcher> dispatcher = nullptr, util::NowFn now = util::Now);

  SendResult Send(const std::string& account, const db::model::ContactRecord& contact, const std::string& content,
                  const SendOptions& options) override;

 private:
  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<Broadcaster>     broadcaster_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  util::NowFn                      now_;
};

} // namespace handoff::notify
