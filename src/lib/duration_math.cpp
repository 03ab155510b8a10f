#include <kairos/duration.hpp>

#include "duration_detail.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace kairos {

  namespace {

    duration
    signed_infinity(bool negative) {
      return negative ? duration::negative_infinity()
                      : duration::positive_infinity();
    }

    // |a| + |b| for finite values, carrying bottom-up.
    duration
    add_magnitudes(const duration& a, const duration& b) {
      const integer& planck_radix = detail::planck_time_per_yoctosecond();

      integer planck = a.planck_time() + b.planck_time();
      uint64_t carry = 0;
      if (planck >= planck_radix) {
        planck -= planck_radix;
        carry = 1;
      }

      uint64_t yocto = a.total_yoctoseconds() + b.total_yoctoseconds() + carry;
      carry = 0;
      if (yocto >= units::yoctoseconds_per_nanosecond) {
        yocto -= units::yoctoseconds_per_nanosecond;
        carry = 1;
      }

      uint64_t nano = a.total_nanoseconds() + b.total_nanoseconds() + carry;
      carry = 0;
      if (nano >= units::nanoseconds_per_year) {
        nano -= units::nanoseconds_per_year;
        carry = 1;
      }

      uint64_t years = uint64_t{a.years()} + b.years() + carry;
      carry = 0;
      if (years >= units::years_per_aeon) {
        years -= units::years_per_aeon;
        carry = 1;
      }

      integer aeons = a.aeons() + b.aeons() + integer(carry);
      detail::check_magnitude(aeons, "aeon");
      return duration::from_canonical_fields(
          false, false, std::move(planck), yocto, nano,
          static_cast<uint32_t>(years), std::move(aeons));
    }

    // |a| - |b| for finite values with |a| >= |b|, borrowing bottom-up.
    duration
    subtract_magnitudes(const duration& a, const duration& b) {
      const integer& planck_radix = detail::planck_time_per_yoctosecond();

      integer planck = a.planck_time() - b.planck_time();
      int64_t borrow = 0;
      if (planck.is_negative()) {
        planck += planck_radix;
        borrow = 1;
      }

      auto yocto = static_cast<int64_t>(a.total_yoctoseconds()) -
                   static_cast<int64_t>(b.total_yoctoseconds()) - borrow;
      borrow = 0;
      if (yocto < 0) {
        yocto += static_cast<int64_t>(units::yoctoseconds_per_nanosecond);
        borrow = 1;
      }

      auto nano = static_cast<int64_t>(a.total_nanoseconds()) -
                  static_cast<int64_t>(b.total_nanoseconds()) - borrow;
      borrow = 0;
      if (nano < 0) {
        nano += static_cast<int64_t>(units::nanoseconds_per_year);
        borrow = 1;
      }

      auto years = static_cast<int64_t>(a.years()) -
                   static_cast<int64_t>(b.years()) - borrow;
      borrow = 0;
      if (years < 0) {
        years += static_cast<int64_t>(units::years_per_aeon);
        borrow = 1;
      }

      integer aeons = a.aeons() - b.aeons() - integer(borrow);
      return duration::from_canonical_fields(
          false, false, std::move(planck), static_cast<uint64_t>(yocto),
          static_cast<uint64_t>(nano), static_cast<uint32_t>(years),
          std::move(aeons));
    }

    duration
    with_sign(const duration& magnitude, bool negative) {
      return negative ? magnitude.negate() : magnitude;
    }

    bool
    is_nan(double value) {
      return std::isnan(value);
    }

  } // namespace

  duration
  duration::add(const duration& other) const {
    if (perpetual_ || other.perpetual_) {
      if (perpetual_ && other.perpetual_) {
        return negative_ == other.negative_ ? *this : zero();
      }
      return perpetual_ ? *this : other;
    }
    if (is_zero()) { return other; }
    if (other.is_zero()) { return *this; }

    if (negative_ == other.negative_) {
      return with_sign(add_magnitudes(*this, other), negative_);
    }

    auto order = abs() <=> other.abs();
    if (order == 0) { return zero(); }
    if (order > 0) {
      return with_sign(subtract_magnitudes(*this, other), negative_);
    }
    return with_sign(subtract_magnitudes(other, *this), other.negative_);
  }

  duration
  duration::subtract(const duration& other) const {
    if (perpetual_ && other.perpetual_) {
      return negative_ == other.negative_ ? zero() : *this;
    }
    if (perpetual_) { return *this; }
    if (other.perpetual_) { return other.negate(); }
    if (other.is_zero()) { return *this; }
    if (is_zero()) { return other.negate(); }
    return add(other.negate());
  }

  duration
  duration::multiply(const integer& factor) const {
    bool negative = negative_ != factor.is_negative();
    if (perpetual_) { return signed_infinity(negative); }
    if (factor.is_zero() || is_zero()) { return zero(); }

    integer scale = factor.abs();
    return normalize(negative, aeons_ * scale, integer(uint64_t{years_}) * scale,
                     integer(total_nanoseconds_) * scale,
                     integer(total_yoctoseconds_) * scale,
                     planck_time_ * scale);
  }

  duration
  duration::multiply(const decimal& factor) const {
    bool negative = negative_ != factor.is_negative();
    if (perpetual_) { return signed_infinity(negative); }
    if (factor.is_zero() || is_zero()) { return zero(); }

    decimal scale = factor.abs();
    decimal scaled_aeons = decimal(aeons_) * scale;
    detail::check_count(scaled_aeons);
    decimal scaled_years =
        decimal(int64_t{years_}) * scale +
        scaled_aeons.fraction() * decimal(int64_t{units::years_per_aeon});

    duration result = from(time_unit::aeon, scaled_aeons.floor());
    result += from(time_unit::year, scaled_years);
    result += from(time_unit::nanosecond,
                   decimal(integer(total_nanoseconds_)) * scale);
    result += from(time_unit::yoctosecond,
                   decimal(integer(total_yoctoseconds_)) * scale);
    result += from(time_unit::planck_time, decimal(planck_time_) * scale);
    return with_sign(result, negative);
  }

  duration
  duration::multiply(double factor) const {
    if (is_nan(factor)) {
      throw std::invalid_argument("duration: scaling factor is NaN");
    }
    bool negative = negative_ != (factor < 0);
    if (perpetual_ || std::isinf(factor)) { return signed_infinity(negative); }
    if (factor == 0.0 || is_zero()) { return zero(); }
    return multiply(decimal(factor));
  }

  duration
  duration::divide(const integer& divisor) const {
    if (is_zero()) { return zero(); }
    if (perpetual_) {
      return signed_infinity(negative_ != divisor.is_negative());
    }
    if (divisor.is_zero()) { return signed_infinity(negative_); }
    return multiply(decimal(int64_t{1}) / decimal(divisor));
  }

  duration
  duration::divide(const decimal& divisor) const {
    if (is_zero()) { return zero(); }
    if (perpetual_) {
      return signed_infinity(negative_ != divisor.is_negative());
    }
    if (divisor.is_zero()) { return signed_infinity(negative_); }
    return multiply(decimal(int64_t{1}) / divisor);
  }

  duration
  duration::divide(double divisor) const {
    if (is_nan(divisor)) {
      throw std::invalid_argument("duration: divisor is NaN");
    }
    if (is_zero()) { return zero(); }
    if (perpetual_) { return signed_infinity(negative_ != (divisor < 0)); }
    if (divisor == 0.0) { return signed_infinity(negative_); }
    if (std::isinf(divisor)) { return zero(); }
    return divide(decimal(divisor));
  }

  double
  duration::divide(const duration& divisor) const {
    constexpr double infinity = std::numeric_limits<double>::infinity();
    bool negative = negative_ != divisor.negative_;

    if (is_zero()) {
      return divisor.is_zero() ? std::numeric_limits<double>::quiet_NaN()
                               : 0.0;
    }
    if (divisor.is_zero()) { return negative_ ? -infinity : infinity; }
    if (perpetual_) { return negative ? -infinity : infinity; }
    if (divisor.perpetual_) { return 0.0; }

    // Finest unit first; coarser units only when the totals no longer fit in
    // a double or truncation empties one side.
    constexpr time_unit levels[] = {
        time_unit::planck_time, time_unit::yoctosecond, time_unit::nanosecond,
        time_unit::second,      time_unit::year,
    };
    for (time_unit level : levels) {
      double ratio =
          static_cast<double>(detail::total_in(*this, level)) /
          static_cast<double>(detail::total_in(divisor, level));
      if (std::isfinite(ratio) && ratio != 0.0) {
        return negative ? -ratio : ratio;
      }
    }
    double ratio = static_cast<double>(aeons_) /
                   static_cast<double>(divisor.aeons_);
    return negative ? -ratio : ratio;
  }

  duration
  duration::modulus(const duration& divisor) const {
    if (is_zero() || perpetual_) { return zero(); }
    // |a| - 0 * floor(|a| / 0) = |a| - infinity, then the sign of a.
    if (divisor.is_zero()) { return signed_infinity(!negative_); }
    if (divisor.perpetual_) { return *this; }

    integer remainder =
        detail::total_in(*this, time_unit::planck_time) %
        detail::total_in(divisor, time_unit::planck_time);
    integer none;
    return normalize(negative_, none, none, none, none, std::move(remainder));
  }

  duration
  operator+(const duration& a, const duration& b) {
    return a.add(b);
  }

  duration
  operator-(const duration& a, const duration& b) {
    return a.subtract(b);
  }

  duration
  operator*(const duration& d, double factor) {
    return d.multiply(factor);
  }

  duration
  operator*(double factor, const duration& d) {
    return d.multiply(factor);
  }

  duration
  operator*(const duration& d, const decimal& factor) {
    return d.multiply(factor);
  }

  duration
  operator*(const duration& d, const integer& factor) {
    return d.multiply(factor);
  }

  duration
  operator/(const duration& d, double divisor) {
    return d.divide(divisor);
  }

  duration
  operator/(const duration& d, const decimal& divisor) {
    return d.divide(divisor);
  }

  duration
  operator/(const duration& d, const integer& divisor) {
    return d.divide(divisor);
  }

  double
  operator/(const duration& a, const duration& b) {
    return a.divide(b);
  }

  duration
  operator%(const duration& a, const duration& b) {
    return a.modulus(b);
  }

  duration&
  duration::operator+=(const duration& other) {
    *this = add(other);
    return *this;
  }

  duration&
  duration::operator-=(const duration& other) {
    *this = subtract(other);
    return *this;
  }

} // namespace kairos
