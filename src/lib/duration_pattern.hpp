#pragma once

#include <kairos/format_info.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kairos::detail {

  enum class format_unit : uint8_t {
    literal,
    total_years,
    years,
    days,
    hours,
    minutes,
    seconds,
    fraction,
    milliseconds,
    microseconds,
    nanoseconds,
    picoseconds,
    femtoseconds,
    attoseconds,
    zeptoseconds,
    yoctoseconds,
    planck_time,
  };

  // One run of a custom pattern: either `count` repetitions of a unit letter
  // or a literal with the culture separators already substituted.
  struct pattern_token {
    format_unit unit = format_unit::literal;
    std::size_t count = 0;
    std::string text;
  };

  // A pattern after standard single-letter expansion. `extensible` selects
  // the unit-symbol algorithm; otherwise `custom` holds the pattern.
  struct resolved_pattern {
    bool extensible = false;
    std::string custom;
  };

  // Empty, blank or unrecognized single-letter patterns resolve to "G".
  resolved_pattern
  resolve_pattern(std::string_view pattern);

  // Adjacent literals are merged into one token.
  std::vector<pattern_token>
  tokenize_pattern(std::string_view pattern, const format_info& info);

  bool
  is_blank(std::string_view text);

} // namespace kairos::detail
