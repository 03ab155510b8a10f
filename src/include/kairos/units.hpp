#pragma once

#include <cstdint>
#include <string_view>

namespace kairos {

  // Days and years are fixed lengths: 1 d = 86,400 s and
  // 1 a = 365.25 d = 31,557,600 s. An aeon is 10^9 years.
  namespace units {

    constexpr uint64_t years_per_aeon = 1'000'000'000;
    constexpr double days_per_year = 365.25;
    constexpr uint64_t hours_per_day = 24;
    constexpr uint64_t hours_per_year = 8'766;
    constexpr uint64_t minutes_per_hour = 60;
    constexpr uint64_t minutes_per_year = 525'960;
    constexpr uint64_t seconds_per_minute = 60;
    constexpr uint64_t seconds_per_hour = 3'600;
    constexpr uint64_t seconds_per_day = 86'400;
    constexpr uint64_t seconds_per_year = 31'557'600;
    constexpr uint64_t milliseconds_per_second = 1'000;
    constexpr uint64_t milliseconds_per_year = 31'557'600'000;
    constexpr uint64_t microseconds_per_millisecond = 1'000;
    constexpr uint64_t microseconds_per_year = 31'557'600'000'000;

    constexpr uint64_t nanoseconds_per_microsecond = 1'000;
    constexpr uint64_t nanoseconds_per_millisecond = 1'000'000;
    constexpr uint64_t nanoseconds_per_second = 1'000'000'000;
    constexpr uint64_t nanoseconds_per_minute = 60'000'000'000;
    constexpr uint64_t nanoseconds_per_hour = 3'600'000'000'000;
    constexpr uint64_t nanoseconds_per_day = 86'400'000'000'000;
    constexpr uint64_t nanoseconds_per_year = 31'557'600'000'000'000;

    constexpr uint64_t picoseconds_per_nanosecond = 1'000;
    constexpr uint64_t femtoseconds_per_nanosecond = 1'000'000;
    constexpr uint64_t femtoseconds_per_picosecond = 1'000;
    constexpr uint64_t attoseconds_per_nanosecond = 1'000'000'000;
    constexpr uint64_t attoseconds_per_femtosecond = 1'000;
    constexpr uint64_t zeptoseconds_per_nanosecond = 1'000'000'000'000;
    constexpr uint64_t zeptoseconds_per_attosecond = 1'000;

    constexpr uint64_t yoctoseconds_per_zeptosecond = 1'000;
    constexpr uint64_t yoctoseconds_per_attosecond = 1'000'000;
    constexpr uint64_t yoctoseconds_per_femtosecond = 1'000'000'000;
    constexpr uint64_t yoctoseconds_per_picosecond = 1'000'000'000'000;
    constexpr uint64_t yoctoseconds_per_nanosecond = 1'000'000'000'000'000;

    // Does not fit in 64 bits; kept as text for kairos::integer and as a
    // double for the floating-point conversions.
    constexpr std::string_view planck_time_per_yoctosecond =
        "185486100000000000000";
    constexpr double planck_time_per_yoctosecond_double = 1.854861e20;

  } // namespace units

  enum class time_unit : uint8_t {
    aeon,
    year,
    day,
    hour,
    minute,
    second,
    millisecond,
    microsecond,
    nanosecond,
    picosecond,
    femtosecond,
    attosecond,
    zeptosecond,
    yoctosecond,
    planck_time,
  };

} // namespace kairos
