#pragma once

#include "notifier.hpp"

namespace handoff::notify {

/*
  Broadcaster and webhook dispatcher that only writes structured log
  lines. Used when no real-time hub is attached to the server.
*/
class LogNotifier final : public Broadcaster, public EventDispatcher {
 public:
  void NotifyOrg(const std::string& organization_id, std::string_view event_type, const Payload& payload) override;

  void Dispatch(const std::string& organization_id, std::string_view event, const Payload& payload) override;
};

} // namespace handoff::notify
