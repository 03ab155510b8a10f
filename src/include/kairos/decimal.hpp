#pragma once

#include <kairos/integer.hpp>

#include <compare>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace kairos {

  // Exact decimal: significand * 10^exponent, kept with trailing zeros
  // stripped so equal values compare structurally. Only division rounds,
  // truncating at default_division_precision fractional digits.
  class decimal {
    integer significand_;
    int exponent_ = 0;

  public:
    static constexpr int default_division_precision = 28;

    decimal() = default;
    explicit decimal(const integer& value);
    explicit decimal(int64_t value);
    // Accepts [sign] digits [. digits] [(e|E) [sign] digits].
    explicit decimal(std::string_view str);
    // The shortest decimal (15 to 17 significant digits) that reads back as
    // `value`. NaN and infinities are rejected with std::invalid_argument.
    explicit decimal(double value);

    static std::optional<decimal>
    try_parse(std::string_view str);

    std::string
    to_string() const;
    bool
    is_zero() const;
    bool
    is_negative() const;

    decimal
    abs() const;
    // Power of ten of the leading significant digit; zero for zero.
    int
    adjusted_exponent() const;
    // Largest integer not greater than the value.
    integer
    floor() const;
    // Value minus floor(): always in [0, 1).
    decimal
    fraction() const;

    decimal
    operator-() const;

    friend decimal
    operator+(const decimal& a, const decimal& b);
    friend decimal
    operator-(const decimal& a, const decimal& b);
    friend decimal
    operator*(const decimal& a, const decimal& b);
    friend decimal
    operator/(const decimal& a, const decimal& b);

    decimal&
    operator+=(const decimal& other);
    decimal&
    operator-=(const decimal& other);
    decimal&
    operator*=(const decimal& other);

    std::strong_ordering
    operator<=>(const decimal& other) const;
    bool
    operator==(const decimal& other) const;

    explicit
    operator double() const;

    friend std::ostream&
    operator<<(std::ostream& os, const decimal& d) {
      return os << d.to_string();
    }
  };

} // namespace kairos

template <>
struct std::hash<kairos::decimal> {
  std::size_t
  operator()(const kairos::decimal& d) const noexcept {
    return std::hash<std::string>{}(d.to_string());
  }
};
