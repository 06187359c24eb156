#pragma once

#include <string>

#include "internal/model/settings.hpp"

namespace handoff::db::sql {

/*
  JSON encoding of the typed settings blocks stored in chatbot_settings.

  Decoding is lenient about missing keys (they keep their defaults) but
  throws std::runtime_error on malformed JSON.
*/

std::string EncodeSla(const handoff::model::SlaSettings& sla);
std::string EncodeClientInactivity(const handoff::model::ClientInactivitySettings& inactivity);
std::string EncodeBusinessHours(const handoff::model::BusinessHours& hours);

handoff::model::SlaSettings              DecodeSla(const std::string& json);
handoff::model::ClientInactivitySettings DecodeClientInactivity(const std::string& json);
handoff::model::BusinessHours            DecodeBusinessHours(const std::string& json);

} // namespace handoff::db::sql
