#pragma once

#include <kairos/decimal.hpp>
#include <kairos/duration.hpp>
#include <kairos/integer.hpp>
#include <kairos/units.hpp>

#include <cstddef>
#include <string_view>

namespace kairos::detail {

  // The Planck-time radix as an integer, built once on first use.
  const integer&
  planck_time_per_yoctosecond();

  // Number of Planck times in one unit.
  integer
  planck_time_per(time_unit unit);

  // Throws std::overflow_error when value has more than
  // duration::max_magnitude_bits significant bits.
  void
  check_magnitude(const integer& value, const char* field);

  // A count of any unit with more integer digits than this exceeds
  // max_magnitude_bits of aeons even in Planck time, the finest unit
  // (2^16384 has 4,933 digits; one aeon is about 5.9e60 Planck times).
  constexpr std::size_t max_count_digits = 5000;

  // Throw std::overflow_error before a count too large for any duration is
  // expanded into an integer.
  void
  check_count(const decimal& count);
  void
  check_count_digits(std::string_view digits);

  // Magnitude of a finite duration expressed in whole units of `unit`,
  // truncated. Only aeon, year, second, nanosecond, yoctosecond and
  // planck_time are supported.
  integer
  total_in(const duration& d, time_unit unit);

} // namespace kairos::detail
