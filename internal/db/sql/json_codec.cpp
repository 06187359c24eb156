#include "json_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace handoff::db::sql {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

void SetNumber(Struct& s, const char* key, double v) {
  (*s.mutable_fields())[key].set_number_value(v);
}

void SetBool(Struct& s, const char* key, bool v) {
  (*s.mutable_fields())[key].set_bool_value(v);
}

void SetString(Struct& s, const char* key, const std::string& v) {
  (*s.mutable_fields())[key].set_string_value(v);
}

std::string ToJson(const Struct& s) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(s, &json);
  if (!status.ok()) {
    throw std::runtime_error("settings encode failed: " + std::string(status.message()));
  }
  return json;
}

Struct FromJson(const std::string& json) {
  Struct s;
  if (json.empty()) return s;
  auto status = google::protobuf::util::JsonStringToMessage(json, &s);
  if (!status.ok()) {
    throw std::runtime_error("settings decode failed: " + std::string(status.message()));
  }
  return s;
}

const Value* Field(const Struct& s, const char* key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

double GetNumber(const Struct& s, const char* key, double fallback = 0) {
  const auto* v = Field(s, key);
  return v && v->kind_case() == Value::kNumberValue ? v->number_value() : fallback;
}

bool GetBool(const Struct& s, const char* key, bool fallback = false) {
  const auto* v = Field(s, key);
  return v && v->kind_case() == Value::kBoolValue ? v->bool_value() : fallback;
}

std::string GetString(const Struct& s, const char* key) {
  const auto* v = Field(s, key);
  return v && v->kind_case() == Value::kStringValue ? v->string_value() : std::string();
}

uint32_t GetMinutes(const Struct& s, const char* key) {
  const double v = GetNumber(s, key);
  return v > 0 ? static_cast<uint32_t>(v) : 0;
}

} // namespace

std::string EncodeSla(const handoff::model::SlaSettings& sla) {
  Struct s;
  SetBool(s, "enabled", sla.enabled);
  SetNumber(s, "response_minutes", sla.response_minutes);
  SetNumber(s, "resolution_minutes", sla.resolution_minutes);
  SetNumber(s, "escalation_minutes", sla.escalation_minutes);
  SetNumber(s, "auto_close_hours", sla.auto_close_hours);
  SetString(s, "auto_close_message", sla.auto_close_message);
  SetString(s, "warning_message", sla.warning_message);

  auto* ids = (*s.mutable_fields())["escalation_notify_ids"].mutable_list_value();
  for (const auto& id : sla.escalation_notify_ids) {
    ids->add_values()->set_string_value(id);
  }
  return ToJson(s);
}

std::string EncodeClientInactivity(const handoff::model::ClientInactivitySettings& inactivity) {
  Struct s;
  SetBool(s, "reminder_enabled", inactivity.reminder_enabled);
  SetNumber(s, "reminder_minutes", inactivity.reminder_minutes);
  SetString(s, "reminder_message", inactivity.reminder_message);
  SetNumber(s, "auto_close_minutes", inactivity.auto_close_minutes);
  SetString(s, "auto_close_message", inactivity.auto_close_message);
  return ToJson(s);
}

std::string EncodeBusinessHours(const handoff::model::BusinessHours& hours) {
  Struct s;
  SetBool(s, "enabled", hours.enabled);
  SetString(s, "out_of_hours_message", hours.out_of_hours_message);
  SetNumber(s, "utc_offset_minutes", hours.utc_offset_minutes);

  auto* days = (*s.mutable_fields())["days"].mutable_list_value();
  for (const auto& day : hours.days) {
    Struct d;
    SetNumber(d, "weekday", day.weekday);
    SetBool(d, "enabled", day.enabled);
    SetNumber(d, "open_minute", day.open_minute);
    SetNumber(d, "close_minute", day.close_minute);
    *days->add_values()->mutable_struct_value() = std::move(d);
  }
  return ToJson(s);
}

handoff::model::SlaSettings DecodeSla(const std::string& json) {
  const Struct s = FromJson(json);

  handoff::model::SlaSettings sla;
  sla.enabled            = GetBool(s, "enabled");
  sla.response_minutes   = GetMinutes(s, "response_minutes");
  sla.resolution_minutes = GetMinutes(s, "resolution_minutes");
  sla.escalation_minutes = GetMinutes(s, "escalation_minutes");
  sla.auto_close_hours   = GetMinutes(s, "auto_close_hours");
  sla.auto_close_message = GetString(s, "auto_close_message");
  sla.warning_message    = GetString(s, "warning_message");

  if (const auto* ids = Field(s, "escalation_notify_ids"); ids && ids->has_list_value()) {
    for (const auto& id : ids->list_value().values()) {
      if (id.kind_case() == Value::kStringValue) sla.escalation_notify_ids.push_back(id.string_value());
    }
  }
  return sla;
}

handoff::model::ClientInactivitySettings DecodeClientInactivity(const std::string& json) {
  const Struct s = FromJson(json);

  handoff::model::ClientInactivitySettings inactivity;
  inactivity.reminder_enabled   = GetBool(s, "reminder_enabled");
  inactivity.reminder_minutes   = GetMinutes(s, "reminder_minutes");
  inactivity.reminder_message   = GetString(s, "reminder_message");
  inactivity.auto_close_minutes = GetMinutes(s, "auto_close_minutes");
  inactivity.auto_close_message = GetString(s, "auto_close_message");
  return inactivity;
}

handoff::model::BusinessHours DecodeBusinessHours(const std::string& json) {
  const Struct s = FromJson(json);

  handoff::model::BusinessHours hours;
  hours.enabled              = GetBool(s, "enabled");
  hours.out_of_hours_message = GetString(s, "out_of_hours_message");
  hours.utc_offset_minutes   = static_cast<int>(GetNumber(s, "utc_offset_minutes"));

  if (const auto* days = Field(s, "days"); days && days->has_list_value()) {
    for (const auto& entry : days->list_value().values()) {
      if (!entry.has_struct_value()) continue;
      const auto&                  d = entry.struct_value();
      handoff::model::BusinessDay day;
      day.weekday      = static_cast<int>(GetNumber(d, "weekday"));
      day.enabled      = GetBool(d, "enabled");
      day.open_minute  = static_cast<int>(GetNumber(d, "open_minute"));
      day.close_minute = static_cast<int>(GetNumber(d, "close_minute"));
      hours.days.push_back(day);
    }
  }
  return hours;
}

} // namespace handoff::db::sql
