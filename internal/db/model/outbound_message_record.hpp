#pragma once

#include <cstdint>
#include <string>

namespace handoff::db::model {

/*
  Customer-facing text waiting for the channel client.
*/
struct OutboundMessageRecord {
  uint64_t    id = 0; // assigned on insert
  std::string organization_id;
  std::string account;
  std::string contact_id;
  std::string phone_number;
  std::string content;
  uint64_t    created_at_ms = 0;
};

} // namespace handoff::db::model
