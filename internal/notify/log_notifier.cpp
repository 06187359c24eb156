#include "log_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace handoff::notify {

using handoff::observability::StringField;

void LogNotifier::NotifyOrg(const std::string& organization_id, std::string_view event_type, const Payload& payload) {
  HANDOFF_LOG_INFO("broadcast", {StringField("org_id", organization_id), StringField("type", event_type),
                                 StringField("payload", ToJson(payload))});
}

void LogNotifier::Dispatch(const std::string& organization_id, std::string_view event, const Payload& payload) {
  HANDOFF_LOG_INFO("webhook event", {StringField("org_id", organization_id), StringField("event", event),
                                     StringField("data", ToJson(payload))});
}

} // namespace handoff::notify
