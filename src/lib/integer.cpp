#include <kairos/integer.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace kairos {

  namespace {

    using limbs = std::vector<uint32_t>;

    void
    trim(limbs& mag) {
      while (!mag.empty() && mag.back() == 0) {
        mag.pop_back();
      }
    }

    // mag = mag * factor + addend
    void
    magnitude_mul_add(limbs& mag, uint32_t factor, uint32_t addend) {
      uint64_t carry = addend;
      for (auto& limb : mag) {
        uint64_t product = static_cast<uint64_t>(limb) * factor + carry;
        limb = static_cast<uint32_t>(product);
        carry = product >> 32;
      }
      if (carry != 0) { mag.push_back(static_cast<uint32_t>(carry)); }
    }

    limbs
    magnitude_from(uint64_t value) {
      limbs mag;
      if (value == 0) { return mag; }
      mag.push_back(static_cast<uint32_t>(value));
      if (uint32_t high = static_cast<uint32_t>(value >> 32)) {
        mag.push_back(high);
      }
      return mag;
    }

    limbs
    magnitude_add(const limbs& a, const limbs& b) {
      limbs result;
      std::size_t len = std::max(a.size(), b.size());
      result.reserve(len + 1);
      uint64_t carry = 0;
      for (std::size_t i = 0; i < len; ++i) {
        uint64_t sum = carry;
        if (i < a.size()) { sum += a[i]; }
        if (i < b.size()) { sum += b[i]; }
        result.push_back(static_cast<uint32_t>(sum));
        carry = sum >> 32;
      }
      if (carry != 0) { result.push_back(static_cast<uint32_t>(carry)); }
      return result;
    }

    std::strong_ordering
    magnitude_compare(const limbs& a, const limbs& b) {
      if (a.size() != b.size()) { return a.size() <=> b.size(); }
      for (auto i = a.size(); i-- > 0;) {
        if (a[i] != b[i]) { return a[i] <=> b[i]; }
      }
      return std::strong_ordering::equal;
    }

    // a - b; a must not be smaller than b.
    limbs
    magnitude_sub(const limbs& a, const limbs& b) {
      limbs result(a);
      int64_t borrow = 0;
      for (std::size_t i = 0; i < result.size(); ++i) {
        int64_t diff = int64_t{result[i]} - borrow -
                       (i < b.size() ? int64_t{b[i]} : 0);
        borrow = diff < 0 ? 1 : 0;
        result[i] = static_cast<uint32_t>(diff + (borrow << 32));
        if (borrow == 0 && i + 1 >= b.size()) { break; }
      }
      trim(result);
      return result;
    }

    limbs
    magnitude_mul(const limbs& a, const limbs& b) {
      if (a.empty() || b.empty()) { return {}; }
      limbs result(a.size() + b.size(), 0);
      for (std::size_t i = 0; i < a.size(); ++i) {
        uint64_t carry = 0;
        for (std::size_t j = 0; j < b.size(); ++j) {
          uint64_t product =
              static_cast<uint64_t>(a[i]) * b[j] + result[i + j] + carry;
          result[i + j] = static_cast<uint32_t>(product);
          carry = product >> 32;
        }
        result[i + b.size()] += static_cast<uint32_t>(carry);
      }
      trim(result);
      return result;
    }

    std::size_t
    magnitude_bits(const limbs& mag) {
      if (mag.empty()) { return 0; }
      std::size_t bits = (mag.size() - 1) * 32;
      for (uint32_t top = mag.back(); top != 0; top >>= 1) {
        ++bits;
      }
      return bits;
    }

    // Short division by a single limb; returns the remainder.
    uint32_t
    magnitude_divmod_small(limbs& mag, uint32_t divisor) {
      uint64_t remainder = 0;
      for (auto it = mag.rbegin(); it != mag.rend(); ++it) {
        uint64_t cur = (remainder << 32) | *it;
        *it = static_cast<uint32_t>(cur / divisor);
        remainder = cur % divisor;
      }
      trim(mag);
      return static_cast<uint32_t>(remainder);
    }

    // remainder = remainder * 2 + bit
    void
    shift_in(limbs& remainder, uint32_t bit) {
      for (auto& limb : remainder) {
        uint32_t out = limb >> 31;
        limb = (limb << 1) | bit;
        bit = out;
      }
      if (bit != 0) { remainder.push_back(bit); }
    }

    // Binary long division, one dividend bit per step. Used only when the
    // divisor spans more than one limb.
    std::pair<limbs, limbs>
    magnitude_divmod(const limbs& a, const limbs& b) {
      if (b.empty()) { throw std::domain_error("integer: division by zero"); }

      auto order = magnitude_compare(a, b);
      if (order < 0) { return {{}, a}; }
      if (order == 0) { return {{1}, {}}; }

      if (b.size() == 1) {
        limbs quotient = a;
        uint32_t rem = magnitude_divmod_small(quotient, b[0]);
        return {std::move(quotient), magnitude_from(rem)};
      }

      limbs quotient(a.size(), 0);
      limbs remainder;
      for (auto bit = magnitude_bits(a); bit-- > 0;) {
        auto word = bit / 32;
        auto offset = bit % 32;
        shift_in(remainder, (a[word] >> offset) & 1u);
        if (magnitude_compare(remainder, b) != std::strong_ordering::less) {
          remainder = magnitude_sub(remainder, b);
          quotient[word] |= uint32_t{1} << offset;
        }
      }

      trim(quotient);
      return {std::move(quotient), std::move(remainder)};
    }

    bool
    all_digits(std::string_view digits) {
      return !digits.empty() &&
             std::all_of(digits.begin(), digits.end(),
                         [](char c) { return c >= '0' && c <= '9'; });
    }

  } // namespace

  integer::integer(std::string_view str) {
    auto parsed = try_parse(str);
    if (!parsed) {
      throw std::invalid_argument("integer: invalid decimal string '" +
                                  std::string(str) + "'");
    }
    *this = std::move(*parsed);
  }

  integer::integer(uint64_t value) : magnitude_(magnitude_from(value)) {}

  integer::integer(int64_t value) {
    if (value < 0) {
      sign_ = sign_type::negative;
      magnitude_ = magnitude_from(uint64_t{0} - static_cast<uint64_t>(value));
    } else {
      magnitude_ = magnitude_from(static_cast<uint64_t>(value));
    }
  }

  std::optional<integer>
  integer::try_parse(std::string_view str) {
    bool negative = false;
    if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
      negative = str[0] == '-';
      str.remove_prefix(1);
    }
    if (!all_digits(str)) { return std::nullopt; }

    integer result;
    // Nine digits at a time keep the limb multiplications short.
    std::size_t pos = 0;
    while (pos < str.size()) {
      std::size_t chunk = std::min<std::size_t>(9, str.size() - pos);
      uint32_t factor = 1;
      uint32_t value = 0;
      for (std::size_t i = 0; i < chunk; ++i) {
        factor *= 10;
        value = value * 10 + static_cast<uint32_t>(str[pos + i] - '0');
      }
      magnitude_mul_add(result.magnitude_, factor, value);
      pos += chunk;
    }
    trim(result.magnitude_);
    if (negative && !result.magnitude_.empty()) {
      result.sign_ = sign_type::negative;
    }
    return result;
  }

  integer
  integer::pow10(unsigned n) {
    integer result(uint64_t{1});
    for (; n >= 9; n -= 9) {
      magnitude_mul_add(result.magnitude_, 1000000000u, 0);
    }
    uint32_t rest = 1;
    for (; n > 0; --n) {
      rest *= 10;
    }
    magnitude_mul_add(result.magnitude_, rest, 0);
    return result;
  }

  std::string
  integer::to_string() const {
    if (magnitude_.empty()) { return "0"; }

    auto mag = magnitude_;
    std::string digits;
    while (!mag.empty()) {
      uint32_t chunk = magnitude_divmod_small(mag, 1000000000u);
      for (int i = 0; i < 9; ++i) {
        digits.push_back(static_cast<char>('0' + chunk % 10));
        chunk /= 10;
        if (mag.empty() && chunk == 0) { break; }
      }
    }

    if (sign_ == sign_type::negative) { digits.push_back('-'); }
    std::reverse(digits.begin(), digits.end());
    return digits;
  }

  bool
  integer::is_zero() const {
    return magnitude_.empty();
  }

  bool
  integer::is_negative() const {
    return sign_ == sign_type::negative;
  }

  integer::sign_type
  integer::sign() const {
    return sign_;
  }

  std::size_t
  integer::bit_width() const {
    return magnitude_bits(magnitude_);
  }

  integer
  integer::abs() const {
    integer result = *this;
    result.sign_ = sign_type::positive;
    return result;
  }

  std::pair<integer, integer>
  integer::divmod(const integer& a, const integer& b) {
    auto [q, r] = magnitude_divmod(a.magnitude_, b.magnitude_);

    std::pair<integer, integer> result;
    result.first.magnitude_ = std::move(q);
    if (!result.first.magnitude_.empty() && a.sign_ != b.sign_) {
      result.first.sign_ = sign_type::negative;
    }
    // Truncating division: r carries the dividend's sign.
    result.second.magnitude_ = std::move(r);
    if (!result.second.magnitude_.empty()) { result.second.sign_ = a.sign_; }
    return result;
  }

  integer
  integer::operator-() const {
    if (magnitude_.empty()) { return *this; }
    integer result = *this;
    result.sign_ = (sign_ == sign_type::positive) ? sign_type::negative
                                                  : sign_type::positive;
    return result;
  }

  integer
  integer::operator+() const {
    return *this;
  }

  std::strong_ordering
  integer::operator<=>(const integer& other) const {
    if (sign_ != other.sign_) {
      return sign_ == sign_type::positive ? std::strong_ordering::greater
                                          : std::strong_ordering::less;
    }
    auto mag_cmp = magnitude_compare(magnitude_, other.magnitude_);
    if (sign_ == sign_type::negative) { return 0 <=> mag_cmp; }
    return mag_cmp;
  }

  bool
  integer::operator==(const integer& other) const {
    return sign_ == other.sign_ && magnitude_ == other.magnitude_;
  }

  integer
  operator+(const integer& a, const integer& b) {
    using sign_type = integer::sign_type;

    integer result;
    if (a.sign_ == b.sign_) {
      result.magnitude_ = magnitude_add(a.magnitude_, b.magnitude_);
      result.sign_ = a.sign_;
    } else {
      auto cmp = magnitude_compare(a.magnitude_, b.magnitude_);
      if (cmp == std::strong_ordering::equal) { return integer(); }
      if (cmp == std::strong_ordering::greater) {
        result.magnitude_ = magnitude_sub(a.magnitude_, b.magnitude_);
        result.sign_ = a.sign_;
      } else {
        result.magnitude_ = magnitude_sub(b.magnitude_, a.magnitude_);
        result.sign_ = b.sign_;
      }
    }
    if (result.magnitude_.empty()) { result.sign_ = sign_type::positive; }
    return result;
  }

  integer
  operator-(const integer& a, const integer& b) {
    return a + (-b);
  }

  integer
  operator*(const integer& a, const integer& b) {
    using sign_type = integer::sign_type;
    if (a.magnitude_.empty() || b.magnitude_.empty()) { return integer(); }

    integer result;
    result.magnitude_ = magnitude_mul(a.magnitude_, b.magnitude_);
    result.sign_ =
        (a.sign_ == b.sign_) ? sign_type::positive : sign_type::negative;
    return result;
  }

  integer
  operator/(const integer& a, const integer& b) {
    return integer::divmod(a, b).first;
  }

  integer
  operator%(const integer& a, const integer& b) {
    return integer::divmod(a, b).second;
  }

  integer&
  integer::operator+=(const integer& other) {
    *this = *this + other;
    return *this;
  }

  integer&
  integer::operator-=(const integer& other) {
    *this = *this - other;
    return *this;
  }

  integer&
  integer::operator*=(const integer& other) {
    *this = *this * other;
    return *this;
  }

  integer::
  operator uint64_t() const {
    if (magnitude_.empty()) { return 0; }
    if (sign_ == sign_type::negative) {
      throw std::overflow_error("integer: negative value cannot convert to "
                                "uint64_t");
    }
    if (magnitude_.size() > 2) {
      throw std::overflow_error("integer: value too large for uint64_t");
    }

    uint64_t val = magnitude_[0];
    if (magnitude_.size() == 2) {
      val |= static_cast<uint64_t>(magnitude_[1]) << 32;
    }
    return val;
  }

  // Overflows to infinity once the magnitude passes DBL_MAX.
  integer::
  operator double() const {
    double result = 0.0;
    for (auto it = magnitude_.rbegin(); it != magnitude_.rend(); ++it) {
      result = result * 4294967296.0 + static_cast<double>(*it);
    }
    return sign_ == sign_type::negative ? -result : result;
  }

  std::size_t
  integer::hash() const noexcept {
    std::size_t seed = std::hash<int>{}(static_cast<int>(sign_));
    for (auto limb : magnitude_) {
      seed ^= std::hash<uint32_t>{}(limb) + 0x9e3779b9 + (seed << 6) +
              (seed >> 2);
    }
    return seed;
  }

} // namespace kairos
