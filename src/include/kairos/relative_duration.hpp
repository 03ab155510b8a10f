#pragma once

#include <kairos/decimal.hpp>
#include <kairos/duration.hpp>
#include <kairos/format_info.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace kairos {

  enum class relative_type : uint8_t {
    absolute,
    proportion_of_day,
    proportion_of_year,
  };

  // A duration that is either absolute or a proportion of a local day or
  // year whose actual length is supplied later. Proportions are never
  // negative.
  //
  // Text form: the duration's own format when absolute, otherwise "Dx<p>"
  // (proportion of a day) or "Yx<p>" (proportion of a year).
  class relative_duration {
    relative_type relativity_ = relative_type::absolute;
    duration duration_;
    decimal proportion_;

  public:
    relative_duration() = default;
    explicit relative_duration(duration d);
    // Throws std::invalid_argument for relative_type::absolute.
    relative_duration(decimal proportion, relative_type relativity);

    static relative_duration
    proportion_of_day(decimal proportion);
    static relative_duration
    proportion_of_year(decimal proportion);

    static relative_duration
    one_local_day();
    static relative_duration
    one_local_year();
    static relative_duration
    one_season();

    relative_type
    relativity() const;
    // Zero unless absolute.
    const duration&
    absolute() const;
    // Zero when absolute.
    const decimal&
    proportion() const;

    bool
    is_zero() const;
    bool
    is_perpetual() const;

    relative_duration
    multiply(double factor) const;
    relative_duration
    divide(double divisor) const;

    duration
    to_duration(const duration& local_year, const duration& local_day) const;

    static const relative_duration&
    max(const relative_duration& a, const relative_duration& b,
        const duration& local_year, const duration& local_day);
    static const relative_duration&
    min(const relative_duration& a, const relative_duration& b,
        const duration& local_year, const duration& local_day);

    std::string
    to_string(std::string_view pattern = {},
              const format_info& info = format_info::invariant()) const;

    static std::optional<relative_duration>
    try_parse(std::string_view text,
              const format_info& info = format_info::invariant());
    static relative_duration
    parse(std::string_view text,
          const format_info& info = format_info::invariant());

    friend relative_duration
    operator*(const relative_duration& r, double factor) {
      return r.multiply(factor);
    }
    friend relative_duration
    operator/(const relative_duration& r, double divisor) {
      return r.divide(divisor);
    }

    bool
    operator==(const relative_duration& other) const;
    bool
    operator==(const duration& other) const;

    friend std::ostream&
    operator<<(std::ostream& os, const relative_duration& r) {
      return os << r.to_string();
    }
  };

} // namespace kairos

template <>
struct std::hash<kairos::relative_duration> {
  std::size_t
  operator()(const kairos::relative_duration& r) const noexcept {
    std::size_t seed = std::hash<kairos::duration>{}(r.absolute());
    seed ^= std::hash<kairos::decimal>{}(r.proportion()) + 0x9e3779b9 +
            (seed << 6) + (seed >> 2);
    seed ^= static_cast<std::size_t>(r.relativity()) + 0x9e3779b9 +
            (seed << 6) + (seed >> 2);
    return seed;
  }
};
