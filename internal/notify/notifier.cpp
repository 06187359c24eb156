#include "notifier.hpp"

#include <google/protobuf/util/json_util.h>

namespace handoff::notify {

void SetString(Payload& payload, std::string_view key, std::string_view value) {
  (*payload.mutable_fields())[std::string(key)].set_string_value(std::string(value));
}

void SetNumber(Payload& payload, std::string_view key, double value) {
  (*payload.mutable_fields())[std::string(key)].set_number_value(value);
}

void SetBool(Payload& payload, std::string_view key, bool value) {
  (*payload.mutable_fields())[std::string(key)].set_bool_value(value);
}

void SetNull(Payload& payload, std::string_view key) {
  (*payload.mutable_fields())[std::string(key)].set_null_value(google::protobuf::NULL_VALUE);
}

void SetStringList(Payload& payload, std::string_view key, const std::vector<std::string>& values) {
  auto* list = (*payload.mutable_fields())[std::string(key)].mutable_list_value();
  for (const auto& value : values) {
    list->add_values()->set_string_value(value);
  }
}

std::string ToJson(const Payload& payload) {
  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(payload, &out);
  if (!status.ok()) {
    return "{}";
  }
  return out;
}

} // namespace handoff::notify
