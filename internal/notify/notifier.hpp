#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/contact_record.hpp"

namespace handoff::notify {

/*
  Collaborators the queue and the scheduler talk to.

  Real-time delivery (websocket hub), webhook fan-out and the channel
  client live outside this service; these interfaces are the seam.
*/

// Event body, serialized as JSON by the implementations.
using Payload = google::protobuf::Struct;

class Broadcaster {
 public:
  virtual ~Broadcaster() = default;

  // real-time update to every connected client of the organization
  virtual void NotifyOrg(const std::string& organization_id, std::string_view event_type, const Payload& payload) = 0;
};

class EventDispatcher {
 public:
  virtual ~EventDispatcher() = default;

  // lifecycle event for external webhook subscribers
  virtual void Dispatch(const std::string& organization_id, std::string_view event, const Payload& payload) = 0;
};

struct SendOptions {
  bool broadcast        = true;
  bool dispatch_webhook = true;
  bool track_sla        = true;
  bool async            = true;
};

// Options for scheduler-driven texts: no webhook, no SLA tracking, synchronous.
inline SendOptions SlaSendOptions() {
  SendOptions options;
  options.broadcast        = true;
  options.dispatch_webhook = false;
  options.track_sla        = false;
  options.async            = false;
  return options;
}

struct SendResult {
  uint64_t message_id = 0;
};

class MessageSender {
 public:
  virtual ~MessageSender() = default;

  // Throws on failure. Must not be called while a repository transaction is open on this thread.
  virtual SendResult Send(const std::string& account, const db::model::ContactRecord& contact, const std::string& content,
                          const SendOptions& options) = 0;
};

/*
  Bundle handed to the queue and the scheduler.
  Any member may be null; a null collaborator is skipped.
*/
struct Notifiers {
  std::shared_ptr<Broadcaster>     broadcaster;
  std::shared_ptr<EventDispatcher> dispatcher;
  std::shared_ptr<MessageSender>   sender;
};

// Payload field setters.
void SetString(Payload& payload, std::string_view key, std::string_view value);
void SetNumber(Payload& payload, std::string_view key, double value);
void SetBool(Payload& payload, std::string_view key, bool value);
void SetNull(Payload& payload, std::string_view key);
void SetStringList(Payload& payload, std::string_view key, const std::vector<std::string>& values);

std::string ToJson(const Payload& payload);

} // namespace handoff::notify
