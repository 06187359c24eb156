#include <cassert>
#include <iostream>

#include "internal/model/settings.hpp"
#include "internal/routing/business_hours.hpp"
#include "internal/util/time.hpp"

namespace {

using handoff::model::BusinessDay;
using handoff::model::BusinessHours;
using handoff::routing::IsWithinBusinessHours;

// Tuesday 2023-11-14 22:13:20 UTC
const auto kTuesdayEvening = handoff::util::FromUnixMillis(1'700'000'000'000ULL);

BusinessHours OfficeHours() {
  BusinessHours hours;
  hours.enabled = true;
  for (int day = 1; day <= 5; ++day) {
    hours.days.push_back(BusinessDay{day, true, 9 * 60, 17 * 60});
  }
  return hours;
}

void TestDisabledOrEmptyNeverGates() {
  BusinessHours hours;
  assert(IsWithinBusinessHours(hours, kTuesdayEvening));

  hours.enabled = true;
  assert(IsWithinBusinessHours(hours, kTuesdayEvening));
}

void TestOutsideWindowInUtc() {
  assert(!IsWithinBusinessHours(OfficeHours(), kTuesdayEvening));
}

void TestOffsetShiftsIntoWindow() {
  auto hours               = OfficeHours();
  hours.utc_offset_minutes = -6 * 60; // 16:13 local
  assert(IsWithinBusinessHours(hours, kTuesdayEvening));
}

void TestOffsetCrossesMidnight() {
  auto hours               = OfficeHours();
  hours.utc_offset_minutes = 2 * 60; // Wednesday 00:13 local
  assert(!IsWithinBusinessHours(hours, kTuesdayEvening));

  hours.days.push_back(BusinessDay{3, true, 0, 60});
  assert(IsWithinBusinessHours(hours, kTuesdayEvening));
}

void TestDisabledDayIsClosed() {
  auto hours               = OfficeHours();
  hours.utc_offset_minutes = -6 * 60;
  for (auto& day : hours.days) {
    if (day.weekday == 2) day.enabled = false;
  }
  assert(!IsWithinBusinessHours(hours, kTuesdayEvening));
}

void TestCloseMinuteIsExclusive() {
  BusinessHours hours;
  hours.enabled = true;
  hours.days.push_back(BusinessDay{2, true, 0, 22 * 60 + 13});
  assert(!IsWithinBusinessHours(hours, kTuesdayEvening));

  hours.days.back().close_minute = 22 * 60 + 14;
  assert(IsWithinBusinessHours(hours, kTuesdayEvening));
}

} // namespace

int main() {
  TestDisabledOrEmptyNeverGates();
  TestOutsideWindowInUtc();
  TestOffsetShiftsIntoWindow();
  TestOffsetCrossesMidnight();
  TestDisabledDayIsClosed();
  TestCloseMinuteIsExclusive();

  std::cout << "handoff_unit_business_hours: pass\n";
  return 0;
}
