#pragma once

#include <kairos/decimal.hpp>
#include <kairos/format_info.hpp>
#include <kairos/integer.hpp>
#include <kairos/units.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace kairos {

  // An absolute duration from one Planck time up to an unbounded number of
  // aeons, held exactly as a sign plus five radix-chained fields:
  //
  //   aeons               unbounded
  //   years               [0, years_per_aeon)
  //   total_nanoseconds   [0, nanoseconds_per_year)
  //   total_yoctoseconds  [0, yoctoseconds_per_nanosecond)
  //   planck_time         [0, planck_time_per_yoctosecond)
  //
  // A perpetual duration is +/- infinity; all of its fields are zero. Zero
  // is never negative.
  class duration {
    bool negative_ = false;
    bool perpetual_ = false;
    integer aeons_;
    uint32_t years_ = 0;
    uint64_t total_nanoseconds_ = 0;
    uint64_t total_yoctoseconds_ = 0;
    integer planck_time_;

    static duration
    normalize(bool negative, integer aeons, integer years, integer nanoseconds,
              integer yoctoseconds, integer planck_time);

  public:
    // Aeon and Planck-time magnitudes above this many bits raise
    // std::overflow_error.
    static constexpr std::size_t max_magnitude_bits = 16384;

    // Input to from_components. Values may exceed their unit's range; any
    // overflow carries into coarser units.
    struct components {
      bool negative = false;
      integer aeons;
      uint64_t years = 0;
      uint64_t days = 0;
      uint64_t hours = 0;
      uint64_t minutes = 0;
      uint64_t seconds = 0;
      uint64_t milliseconds = 0;
      uint64_t microseconds = 0;
      uint64_t nanoseconds = 0;
      uint64_t picoseconds = 0;
      uint64_t femtoseconds = 0;
      uint64_t attoseconds = 0;
      uint64_t zeptoseconds = 0;
      uint64_t yoctoseconds = 0;
      integer planck_time;
    };

    duration() = default;

    static duration
    from_components(const components& c);

    // Stores already-canonical fields without renormalizing. Throws
    // std::invalid_argument when a field is out of range.
    static duration
    from_canonical_fields(bool negative, bool perpetual, integer planck_time,
                          uint64_t total_yoctoseconds,
                          uint64_t total_nanoseconds, uint32_t years,
                          integer aeons);

    static duration
    from(time_unit unit, const integer& value);
    static duration
    from(time_unit unit, const decimal& value);
    static duration
    from(time_unit unit, double value);

    static duration
    zero();
    static duration
    positive_infinity();
    static duration
    negative_infinity();
    static duration
    one(time_unit unit);

    bool
    is_negative() const;
    bool
    is_perpetual() const;
    const integer&
    aeons() const;
    uint32_t
    years() const;
    uint64_t
    total_nanoseconds() const;
    uint64_t
    total_yoctoseconds() const;
    const integer&
    planck_time() const;

    uint32_t
    days() const;
    uint32_t
    hours() const;
    uint32_t
    minutes() const;
    uint32_t
    seconds() const;
    uint32_t
    milliseconds() const;
    uint32_t
    microseconds() const;
    uint32_t
    nanoseconds() const;
    uint32_t
    picoseconds() const;
    uint32_t
    femtoseconds() const;
    uint32_t
    attoseconds() const;
    uint32_t
    zeptoseconds() const;
    uint32_t
    yoctoseconds() const;

    bool
    is_zero() const;
    bool
    is_positive_infinity() const;
    bool
    is_negative_infinity() const;
    int
    sign() const;

    // Signed floating-point approximation in the given unit.
    double
    to(time_unit unit) const;

    duration
    negate() const;
    duration
    abs() const;
    duration
    add(const duration& other) const;
    duration
    subtract(const duration& other) const;

    duration
    multiply(const integer& factor) const;
    duration
    multiply(const decimal& factor) const;
    duration
    multiply(double factor) const;

    duration
    divide(const integer& divisor) const;
    duration
    divide(const decimal& divisor) const;
    duration
    divide(double divisor) const;

    // Best-effort ratio; may lose precision for operands of very different
    // magnitude, never fails.
    double
    divide(const duration& divisor) const;

    duration
    modulus(const duration& divisor) const;

    static const duration&
    max(const duration& a, const duration& b);
    static const duration&
    min(const duration& a, const duration& b);

    std::string
    to_string(std::string_view pattern = {},
              const format_info& info = format_info::invariant()) const;

    static std::optional<duration>
    try_parse(std::string_view text,
              const format_info& info = format_info::invariant());
    static duration
    parse(std::string_view text,
          const format_info& info = format_info::invariant());
    static std::optional<duration>
    try_parse_exact(std::string_view text, std::string_view pattern,
                    const format_info& info = format_info::invariant());
    static duration
    parse_exact(std::string_view text, std::string_view pattern,
                const format_info& info = format_info::invariant());

    duration
    operator-() const;
    duration
    operator+() const;

    friend duration
    operator+(const duration& a, const duration& b);
    friend duration
    operator-(const duration& a, const duration& b);
    friend duration
    operator*(const duration& d, double factor);
    friend duration
    operator*(double factor, const duration& d);
    friend duration
    operator*(const duration& d, const decimal& factor);
    friend duration
    operator*(const duration& d, const integer& factor);
    friend duration
    operator/(const duration& d, double divisor);
    friend duration
    operator/(const duration& d, const decimal& divisor);
    friend duration
    operator/(const duration& d, const integer& divisor);
    friend double
    operator/(const duration& a, const duration& b);
    friend duration
    operator%(const duration& a, const duration& b);

    duration&
    operator+=(const duration& other);
    duration&
    operator-=(const duration& other);

    std::strong_ordering
    operator<=>(const duration& other) const;
    bool
    operator==(const duration& other) const;

    friend std::ostream&
    operator<<(std::ostream& os, const duration& d) {
      return os << d.to_string();
    }
  };

} // namespace kairos

template <>
struct std::hash<kairos::duration> {
  std::size_t
  operator()(const kairos::duration& d) const noexcept {
    std::size_t seed = std::hash<bool>{}(d.is_negative());
    auto mix = [&seed](std::size_t h) {
      seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    };
    mix(std::hash<bool>{}(d.is_perpetual()));
    mix(d.aeons().hash());
    mix(std::hash<uint32_t>{}(d.years()));
    mix(std::hash<uint64_t>{}(d.total_nanoseconds()));
    mix(std::hash<uint64_t>{}(d.total_yoctoseconds()));
    mix(d.planck_time().hash());
    return seed;
  }
};
