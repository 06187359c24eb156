#include "business_hours.hpp"

#include <chrono>

namespace handoff::routing {

bool IsWithinBusinessHours(const model::BusinessHours& hours, util::TimePoint now) {
  if (!hours.enabled || hours.days.empty()) {
    return true;
  }

  const auto local = now + std::chrono::minutes(hours.utc_offset_minutes);
  const auto day   = std::chrono::floor<std::chrono::days>(local);

  const int weekday = static_cast<int>(std::chrono::weekday(std::chrono::sys_days(day)).c_encoding());
  const int minute  = static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(local - day).count());

  for (const auto& entry : hours.days) {
    if (entry.weekday != weekday || !entry.enabled) {
      continue;
    }
    if (minute >= entry.open_minute && minute < entry.close_minute) {
      return true;
    }
  }
  return false;
}

} // namespace handoff::routing
