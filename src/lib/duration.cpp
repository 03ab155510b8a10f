#include <kairos/duration.hpp>

#include "duration_detail.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace kairos {

  namespace {

    integer
    scaled(uint64_t count, uint64_t per_unit) {
      return integer(count) * integer(per_unit);
    }

  } // namespace

  namespace detail {

    const integer&
    planck_time_per_yoctosecond() {
      static const integer value(units::planck_time_per_yoctosecond);
      return value;
    }

    void
    check_magnitude(const integer& value, const char* field) {
      if (value.bit_width() > duration::max_magnitude_bits) {
        throw std::overflow_error(std::string("duration: ") + field +
                                  " magnitude exceeds the supported range");
      }
    }

    void
    check_count(const decimal& count) {
      if (count.adjusted_exponent() >= static_cast<int>(max_count_digits)) {
        throw std::overflow_error(
            "duration: count exceeds the supported range");
      }
    }

    void
    check_count_digits(std::string_view digits) {
      std::size_t first = digits.find_first_not_of('0');
      if (first == std::string_view::npos) { return; }
      if (digits.size() - first > max_count_digits) {
        throw std::overflow_error(
            "duration: count exceeds the supported range");
      }
    }

  } // namespace detail

  duration
  duration::normalize(bool negative, integer aeons, integer years,
                      integer nanoseconds, integer yoctoseconds,
                      integer planck_time) {
    auto [carry_yocto, planck] =
        integer::divmod(planck_time, detail::planck_time_per_yoctosecond());
    yoctoseconds += carry_yocto;

    auto [carry_nano, yocto] = integer::divmod(
        yoctoseconds, integer(units::yoctoseconds_per_nanosecond));
    nanoseconds += carry_nano;

    auto [carry_years, nano] = integer::divmod(
        nanoseconds, integer(units::nanoseconds_per_year));
    years += carry_years;

    auto [carry_aeons, year] =
        integer::divmod(years, integer(units::years_per_aeon));
    aeons += carry_aeons;
    detail::check_magnitude(aeons, "aeon");

    duration result;
    result.aeons_ = std::move(aeons);
    result.years_ = static_cast<uint32_t>(static_cast<uint64_t>(year));
    result.total_nanoseconds_ = static_cast<uint64_t>(nano);
    result.total_yoctoseconds_ = static_cast<uint64_t>(yocto);
    result.planck_time_ = std::move(planck);
    result.negative_ = negative && !result.is_zero();
    return result;
  }

  duration
  duration::from_components(const components& c) {
    if (c.aeons.is_negative()) {
      throw std::invalid_argument("duration: aeons must not be negative");
    }
    if (c.planck_time.is_negative()) {
      throw std::invalid_argument("duration: planck_time must not be negative");
    }
    detail::check_magnitude(c.aeons, "aeon");
    detail::check_magnitude(c.planck_time, "Planck time");

    integer nanoseconds = scaled(c.days, units::nanoseconds_per_day) +
                          scaled(c.hours, units::nanoseconds_per_hour) +
                          scaled(c.minutes, units::nanoseconds_per_minute) +
                          scaled(c.seconds, units::nanoseconds_per_second) +
                          scaled(c.milliseconds,
                                 units::nanoseconds_per_millisecond) +
                          scaled(c.microseconds,
                                 units::nanoseconds_per_microsecond) +
                          integer(c.nanoseconds);

    integer yoctoseconds =
        scaled(c.picoseconds, units::yoctoseconds_per_picosecond) +
        scaled(c.femtoseconds, units::yoctoseconds_per_femtosecond) +
        scaled(c.attoseconds, units::yoctoseconds_per_attosecond) +
        scaled(c.zeptoseconds, units::yoctoseconds_per_zeptosecond) +
        integer(c.yoctoseconds);

    return normalize(c.negative, c.aeons, integer(c.years),
                     std::move(nanoseconds), std::move(yoctoseconds),
                     c.planck_time);
  }

  duration
  duration::from_canonical_fields(bool negative, bool perpetual,
                                  integer planck_time,
                                  uint64_t total_yoctoseconds,
                                  uint64_t total_nanoseconds, uint32_t years,
                                  integer aeons) {
    duration result;
    result.negative_ = negative;
    result.perpetual_ = perpetual;
    if (perpetual) { return result; }

    if (aeons.is_negative() || planck_time.is_negative()) {
      throw std::invalid_argument(
          "duration: canonical fields must not be negative");
    }
    if (planck_time >= detail::planck_time_per_yoctosecond() ||
        total_yoctoseconds >= units::yoctoseconds_per_nanosecond ||
        total_nanoseconds >= units::nanoseconds_per_year ||
        years >= units::years_per_aeon) {
      throw std::invalid_argument(
          "duration: canonical field exceeds its unit range");
    }
    detail::check_magnitude(aeons, "aeon");

    result.aeons_ = std::move(aeons);
    result.years_ = years;
    result.total_nanoseconds_ = total_nanoseconds;
    result.total_yoctoseconds_ = total_yoctoseconds;
    result.planck_time_ = std::move(planck_time);
    if (result.is_zero()) { result.negative_ = false; }
    return result;
  }

  duration
  duration::zero() {
    return duration();
  }

  duration
  duration::positive_infinity() {
    return from_canonical_fields(false, true, integer(), 0, 0, 0, integer());
  }

  duration
  duration::negative_infinity() {
    return from_canonical_fields(true, true, integer(), 0, 0, 0, integer());
  }

  duration
  duration::one(time_unit unit) {
    using namespace units;
    auto nano = [](uint64_t ns) {
      return from_canonical_fields(false, false, integer(), 0, ns, 0,
                                   integer());
    };
    auto yocto = [](uint64_t ys) {
      return from_canonical_fields(false, false, integer(), ys, 0, 0,
                                   integer());
    };

    switch (unit) {
      case time_unit::aeon:
        return from_canonical_fields(false, false, integer(), 0, 0, 0,
                                     integer(uint64_t{1}));
      case time_unit::year:
        return from_canonical_fields(false, false, integer(), 0, 0, 1,
                                     integer());
      case time_unit::day: return nano(nanoseconds_per_day);
      case time_unit::hour: return nano(nanoseconds_per_hour);
      case time_unit::minute: return nano(nanoseconds_per_minute);
      case time_unit::second: return nano(nanoseconds_per_second);
      case time_unit::millisecond: return nano(nanoseconds_per_millisecond);
      case time_unit::microsecond: return nano(nanoseconds_per_microsecond);
      case time_unit::nanosecond: return nano(1);
      case time_unit::picosecond: return yocto(yoctoseconds_per_picosecond);
      case time_unit::femtosecond: return yocto(yoctoseconds_per_femtosecond);
      case time_unit::attosecond: return yocto(yoctoseconds_per_attosecond);
      case time_unit::zeptosecond:
        return yocto(yoctoseconds_per_zeptosecond);
      case time_unit::yoctosecond: return yocto(1);
      case time_unit::planck_time:
        return from_canonical_fields(false, false, integer(uint64_t{1}), 0, 0,
                                     0, integer());
    }
    throw std::invalid_argument("duration: unknown time unit");
  }

  bool
  duration::is_negative() const {
    return negative_;
  }

  bool
  duration::is_perpetual() const {
    return perpetual_;
  }

  const integer&
  duration::aeons() const {
    return aeons_;
  }

  uint32_t
  duration::years() const {
    return years_;
  }

  uint64_t
  duration::total_nanoseconds() const {
    return total_nanoseconds_;
  }

  uint64_t
  duration::total_yoctoseconds() const {
    return total_yoctoseconds_;
  }

  const integer&
  duration::planck_time() const {
    return planck_time_;
  }

  uint32_t
  duration::days() const {
    return static_cast<uint32_t>(total_nanoseconds_ /
                                 units::nanoseconds_per_day);
  }

  uint32_t
  duration::hours() const {
    return static_cast<uint32_t>(total_nanoseconds_ /
                                 units::nanoseconds_per_hour %
                                 units::hours_per_day);
  }

  uint32_t
  duration::minutes() const {
    return static_cast<uint32_t>(total_nanoseconds_ /
                                 units::nanoseconds_per_minute %
                                 units::minutes_per_hour);
  }

  uint32_t
  duration::seconds() const {
    return static_cast<uint32_t>(total_nanoseconds_ /
                                 units::nanoseconds_per_second %
                                 units::seconds_per_minute);
  }

  uint32_t
  duration::milliseconds() const {
    return static_cast<uint32_t>(total_nanoseconds_ /
                                 units::nanoseconds_per_millisecond %
                                 units::milliseconds_per_second);
  }

  uint32_t
  duration::microseconds() const {
    return static_cast<uint32_t>(total_nanoseconds_ /
                                 units::nanoseconds_per_microsecond %
                                 units::microseconds_per_millisecond);
  }

  uint32_t
  duration::nanoseconds() const {
    return static_cast<uint32_t>(total_nanoseconds_ %
                                 units::nanoseconds_per_microsecond);
  }

  uint32_t
  duration::picoseconds() const {
    return static_cast<uint32_t>(total_yoctoseconds_ /
                                 units::yoctoseconds_per_picosecond);
  }

  uint32_t
  duration::femtoseconds() const {
    return static_cast<uint32_t>(total_yoctoseconds_ /
                                 units::yoctoseconds_per_femtosecond %
                                 units::femtoseconds_per_picosecond);
  }

  uint32_t
  duration::attoseconds() const {
    return static_cast<uint32_t>(total_yoctoseconds_ /
                                 units::yoctoseconds_per_attosecond %
                                 units::attoseconds_per_femtosecond);
  }

  uint32_t
  duration::zeptoseconds() const {
    return static_cast<uint32_t>(total_yoctoseconds_ /
                                 units::yoctoseconds_per_zeptosecond %
                                 units::zeptoseconds_per_attosecond);
  }

  uint32_t
  duration::yoctoseconds() const {
    return static_cast<uint32_t>(total_yoctoseconds_ %
                                 units::yoctoseconds_per_zeptosecond);
  }

  bool
  duration::is_zero() const {
    return !perpetual_ && years_ == 0 && total_nanoseconds_ == 0 &&
           total_yoctoseconds_ == 0 && planck_time_.is_zero() &&
           aeons_.is_zero();
  }

  bool
  duration::is_positive_infinity() const {
    return perpetual_ && !negative_;
  }

  bool
  duration::is_negative_infinity() const {
    return perpetual_ && negative_;
  }

  int
  duration::sign() const {
    if (is_zero()) { return 0; }
    return negative_ ? -1 : 1;
  }

  duration
  duration::negate() const {
    duration result = *this;
    if (!is_zero()) { result.negative_ = !negative_; }
    return result;
  }

  duration
  duration::abs() const {
    duration result = *this;
    result.negative_ = false;
    return result;
  }

  const duration&
  duration::max(const duration& a, const duration& b) {
    return a >= b ? a : b;
  }

  const duration&
  duration::min(const duration& a, const duration& b) {
    return a <= b ? a : b;
  }

  duration
  duration::operator-() const {
    return negate();
  }

  duration
  duration::operator+() const {
    return *this;
  }

  std::strong_ordering
  duration::operator<=>(const duration& other) const {
    int lhs_sign = sign();
    int rhs_sign = other.sign();
    if (lhs_sign != rhs_sign) { return lhs_sign <=> rhs_sign; }
    if (lhs_sign == 0) { return std::strong_ordering::equal; }

    // Same non-zero sign from here on; magnitudes order in the direction of
    // that sign.
    auto directed = [lhs_sign](std::strong_ordering magnitude) {
      return lhs_sign > 0 ? magnitude : 0 <=> magnitude;
    };

    if (perpetual_ || other.perpetual_) {
      return directed(static_cast<int>(perpetual_) <=>
                      static_cast<int>(other.perpetual_));
    }
    if (auto c = aeons_ <=> other.aeons_; c != 0) { return directed(c); }
    if (auto c = years_ <=> other.years_; c != 0) { return directed(c); }
    if (auto c = total_nanoseconds_ <=> other.total_nanoseconds_; c != 0) {
      return directed(c);
    }
    if (auto c = total_yoctoseconds_ <=> other.total_yoctoseconds_; c != 0) {
      return directed(c);
    }
    return directed(planck_time_ <=> other.planck_time_);
  }

  bool
  duration::operator==(const duration& other) const {
    return negative_ == other.negative_ && perpetual_ == other.perpetual_ &&
           planck_time_ == other.planck_time_ &&
           total_yoctoseconds_ == other.total_yoctoseconds_ &&
           total_nanoseconds_ == other.total_nanoseconds_ &&
           years_ == other.years_ && aeons_ == other.aeons_;
  }

} // namespace kairos
