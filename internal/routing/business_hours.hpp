#pragma once

#include "internal/model/settings.hpp"
#include "internal/util/time.hpp"

namespace handoff::routing {

/*
  True when `now`, shifted by the configured UTC offset, falls inside
  an enabled [open, close) window for its weekday. A weekday without
  an enabled entry is closed. Disabled hours, or hours with no days
  configured, never gate anything.
*/
bool IsWithinBusinessHours(const model::BusinessHours& hours, util::TimePoint now);

} // namespace handoff::routing
