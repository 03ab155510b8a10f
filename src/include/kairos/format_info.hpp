#pragma once

#include <string>

namespace kairos {

  // Culture-dependent text used when formatting and parsing durations.
  struct format_info {
    std::string positive_infinity_symbol = "Infinity";
    std::string negative_infinity_symbol = "-Infinity";
    std::string negative_sign = "-";
    std::string decimal_separator = ".";
    std::string group_separator = ",";
    std::string time_separator = ":";
    std::string date_separator = "/";

    static const format_info&
    invariant() {
      static const format_info info;
      return info;
    }
  };

} // namespace kairos
