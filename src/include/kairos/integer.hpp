#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kairos {

  // Signed arbitrary-precision integer with value semantics.
  //
  // The magnitude is stored little-endian in 32-bit limbs with no trailing
  // zero limbs, so zero is the empty vector and has exactly one
  // representation (positive).
  class integer {
  public:
    enum class sign_type : uint8_t { positive, negative };

  private:
    sign_type sign_ = sign_type::positive;
    std::vector<uint32_t> magnitude_;

  public:
    integer() = default;
    explicit integer(int64_t value);
    explicit integer(uint64_t value);
    explicit integer(std::string_view str);

    // Parses an optionally signed run of decimal digits without throwing.
    static std::optional<integer>
    try_parse(std::string_view str);

    // 10^n.
    static integer
    pow10(unsigned n);

    std::string
    to_string() const;
    bool
    is_zero() const;
    bool
    is_negative() const;
    sign_type
    sign() const;

    // Number of significant bits in the magnitude (0 for zero).
    std::size_t
    bit_width() const;

    integer
    abs() const;

    // Truncating quotient and remainder in one pass. Throws
    // std::domain_error when the divisor is zero.
    static std::pair<integer, integer>
    divmod(const integer& a, const integer& b);

    integer
    operator-() const;
    integer
    operator+() const;

    friend integer
    operator+(const integer& a, const integer& b);
    friend integer
    operator-(const integer& a, const integer& b);
    friend integer
    operator*(const integer& a, const integer& b);
    friend integer
    operator/(const integer& a, const integer& b);
    friend integer
    operator%(const integer& a, const integer& b);

    integer&
    operator+=(const integer& other);
    integer&
    operator-=(const integer& other);
    integer&
    operator*=(const integer& other);

    std::strong_ordering
    operator<=>(const integer& other) const;
    bool
    operator==(const integer& other) const;

    explicit
    operator uint64_t() const;
    explicit
    operator double() const;

    std::size_t
    hash() const noexcept;

    friend std::ostream&
    operator<<(std::ostream& os, const integer& i) {
      return os << i.to_string();
    }
  };

} // namespace kairos

template <>
struct std::hash<kairos::integer> {
  std::size_t
  operator()(const kairos::integer& i) const noexcept {
    return i.hash();
  }
};
