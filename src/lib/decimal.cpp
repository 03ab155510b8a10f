#include <kairos/decimal.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace kairos {

  namespace {

    // Canonical form: no factor of ten left in the significand, and 0e0.
    void
    normalize(integer& significand, int& exponent) {
      if (significand.is_zero()) {
        exponent = 0;
        return;
      }

      integer ten(int64_t{10});
      while (true) {
        auto [q, r] = integer::divmod(significand, ten);
        if (!r.is_zero()) { break; }
        significand = std::move(q);
        ++exponent;
      }
    }

    struct aligned {
      integer a;
      integer b;
      int exponent;
    };

    aligned
    align_exponents(const integer& sig_a, int exp_a, const integer& sig_b,
                    int exp_b) {
      if (exp_a == exp_b) { return {sig_a, sig_b, exp_a}; }
      if (exp_a < exp_b) {
        return {sig_a,
                sig_b * integer::pow10(static_cast<unsigned>(exp_b - exp_a)),
                exp_a};
      }
      return {sig_a * integer::pow10(static_cast<unsigned>(exp_a - exp_b)),
              sig_b, exp_b};
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

  } // namespace

  decimal::decimal(const integer& value) : significand_(value) {
    normalize(significand_, exponent_);
  }

  decimal::decimal(int64_t value) : decimal(integer(value)) {}

  decimal::decimal(std::string_view str) {
    auto parsed = try_parse(str);
    if (!parsed) {
      throw std::invalid_argument("decimal: invalid decimal string '" +
                                  std::string(str) + "'");
    }
    *this = std::move(*parsed);
  }

  decimal::decimal(double value) {
    if (!std::isfinite(value)) {
      throw std::invalid_argument("decimal: value is not finite");
    }
    if (value == 0.0) { return; }
    // Shortest of 15..17 significant digits that reads back as `value`.
    char buf[64];
    for (int digits = 15; digits <= 17; ++digits) {
      std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, value);
      if (std::strtod(buf, nullptr) == value) { break; }
    }
    *this = decimal(std::string_view(buf));
  }

  std::optional<decimal>
  decimal::try_parse(std::string_view str) {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < str.size() && (str[pos] == '-' || str[pos] == '+')) {
      negative = str[pos] == '-';
      ++pos;
    }

    std::string digits;
    int fraction_digits = 0;
    while (pos < str.size() && is_digit(str[pos])) {
      digits.push_back(str[pos++]);
    }
    if (pos < str.size() && str[pos] == '.') {
      ++pos;
      while (pos < str.size() && is_digit(str[pos])) {
        digits.push_back(str[pos++]);
        ++fraction_digits;
      }
    }
    if (digits.empty()) { return std::nullopt; }

    int exponent = 0;
    if (pos < str.size() && (str[pos] == 'e' || str[pos] == 'E')) {
      ++pos;
      bool exp_negative = false;
      if (pos < str.size() && (str[pos] == '-' || str[pos] == '+')) {
        exp_negative = str[pos] == '-';
        ++pos;
      }
      std::size_t start = pos;
      while (pos < str.size() && is_digit(str[pos])) {
        if (exponent > 100000) { return std::nullopt; }
        exponent = exponent * 10 + (str[pos] - '0');
        ++pos;
      }
      if (pos == start) { return std::nullopt; }
      if (exp_negative) { exponent = -exponent; }
    }
    if (pos != str.size()) { return std::nullopt; }

    auto significand = integer::try_parse(digits);
    if (!significand) { return std::nullopt; }

    decimal result;
    result.significand_ = negative ? -*significand : *significand;
    result.exponent_ = exponent - fraction_digits;
    normalize(result.significand_, result.exponent_);
    return result;
  }

  std::string
  decimal::to_string() const {
    if (significand_.is_zero()) { return "0.0"; }

    std::string digits = significand_.abs().to_string();
    std::string sign = significand_.is_negative() ? "-" : "";

    if (exponent_ >= 0) {
      digits.append(static_cast<std::size_t>(exponent_), '0');
      return sign + digits + ".0";
    }

    auto places = static_cast<std::size_t>(-exponent_);
    if (digits.size() <= places) {
      std::string result = "0.";
      result.append(places - digits.size(), '0');
      return sign + result + digits;
    }

    return sign + digits.substr(0, digits.size() - places) + "." +
           digits.substr(digits.size() - places);
  }

  bool
  decimal::is_zero() const {
    return significand_.is_zero();
  }

  bool
  decimal::is_negative() const {
    return significand_.is_negative();
  }

  decimal
  decimal::abs() const {
    decimal result = *this;
    result.significand_ = significand_.abs();
    return result;
  }

  int
  decimal::adjusted_exponent() const {
    if (significand_.is_zero()) { return 0; }
    auto digits = static_cast<int>(significand_.abs().to_string().size());
    return digits - 1 + exponent_;
  }

  integer
  decimal::floor() const {
    if (exponent_ >= 0) {
      return significand_ * integer::pow10(static_cast<unsigned>(exponent_));
    }
    if (adjusted_exponent() < 0) {
      return significand_.is_negative() ? integer(int64_t{-1}) : integer();
    }
    auto [q, r] = integer::divmod(
        significand_, integer::pow10(static_cast<unsigned>(-exponent_)));
    if (r.is_negative()) { q -= integer(int64_t{1}); }
    return q;
  }

  decimal
  decimal::fraction() const {
    return *this - decimal(floor());
  }

  decimal
  decimal::operator-() const {
    decimal result;
    result.significand_ = -significand_;
    result.exponent_ = exponent_;
    return result;
  }

  decimal
  operator+(const decimal& a, const decimal& b) {
    if (a.is_zero()) { return b; }
    if (b.is_zero()) { return a; }
    auto [sa, sb, exp] = align_exponents(a.significand_, a.exponent_,
                                         b.significand_, b.exponent_);
    decimal result;
    result.significand_ = sa + sb;
    result.exponent_ = exp;
    normalize(result.significand_, result.exponent_);
    return result;
  }

  decimal
  operator-(const decimal& a, const decimal& b) {
    return a + (-b);
  }

  decimal
  operator*(const decimal& a, const decimal& b) {
    decimal result;
    result.significand_ = a.significand_ * b.significand_;
    result.exponent_ = a.exponent_ + b.exponent_;
    normalize(result.significand_, result.exponent_);
    return result;
  }

  decimal
  operator/(const decimal& a, const decimal& b) {
    if (b.significand_.is_zero()) {
      throw std::domain_error("decimal: division by zero");
    }
    if (a.significand_.is_zero()) { return decimal(); }

    // Scale the dividend so the quotient keeps `precision` digits beyond
    // the divisor's magnitude, then truncate.
    int precision = decimal::default_division_precision +
                    static_cast<int>(b.significand_.abs().to_string().size());
    integer scaled =
        a.significand_ * integer::pow10(static_cast<unsigned>(precision));

    decimal result;
    result.significand_ = scaled / b.significand_;
    result.exponent_ = a.exponent_ - b.exponent_ - precision;
    normalize(result.significand_, result.exponent_);
    return result;
  }

  decimal&
  decimal::operator+=(const decimal& other) {
    *this = *this + other;
    return *this;
  }

  decimal&
  decimal::operator-=(const decimal& other) {
    *this = *this - other;
    return *this;
  }

  decimal&
  decimal::operator*=(const decimal& other) {
    *this = *this * other;
    return *this;
  }

  std::strong_ordering
  decimal::operator<=>(const decimal& other) const {
    auto [sa, sb, exp] = align_exponents(significand_, exponent_,
                                         other.significand_, other.exponent_);
    return sa <=> sb;
  }

  bool
  decimal::operator==(const decimal& other) const {
    return significand_ == other.significand_ && exponent_ == other.exponent_;
  }

  decimal::
  operator double() const {
    if (significand_.is_zero()) { return 0.0; }
    return static_cast<double>(significand_) * std::pow(10.0, exponent_);
  }

} // namespace kairos
