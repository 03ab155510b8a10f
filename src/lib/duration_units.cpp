#include <kairos/duration.hpp>

#include "duration_detail.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace kairos {

  namespace {

    uint64_t
    nanoseconds_per(time_unit unit) {
      switch (unit) {
        case time_unit::day: return units::nanoseconds_per_day;
        case time_unit::hour: return units::nanoseconds_per_hour;
        case time_unit::minute: return units::nanoseconds_per_minute;
        case time_unit::second: return units::nanoseconds_per_second;
        case time_unit::millisecond: return units::nanoseconds_per_millisecond;
        case time_unit::microsecond: return units::nanoseconds_per_microsecond;
        default: return 1;
      }
    }

    uint64_t
    yoctoseconds_per(time_unit unit) {
      switch (unit) {
        case time_unit::picosecond: return units::yoctoseconds_per_picosecond;
        case time_unit::femtosecond:
          return units::yoctoseconds_per_femtosecond;
        case time_unit::attosecond: return units::yoctoseconds_per_attosecond;
        case time_unit::zeptosecond:
          return units::yoctoseconds_per_zeptosecond;
        default: return 1;
      }
    }

    integer
    total_years(const duration& d) {
      return d.aeons() * integer(units::years_per_aeon) +
             integer(uint64_t{d.years()});
    }

    integer
    total_nanoseconds(const duration& d) {
      return total_years(d) * integer(units::nanoseconds_per_year) +
             integer(d.total_nanoseconds());
    }

    integer
    total_yoctoseconds(const duration& d) {
      return total_nanoseconds(d) *
                 integer(units::yoctoseconds_per_nanosecond) +
             integer(d.total_yoctoseconds());
    }

    // Magnitude in nanoseconds, including the sub-nanosecond fields.
    double
    nanoseconds_double(const duration& d) {
      double planck_in_yocto = static_cast<double>(d.planck_time()) /
                               units::planck_time_per_yoctosecond_double;
      double yocto = static_cast<double>(d.total_yoctoseconds()) +
                     planck_in_yocto;
      return static_cast<double>(total_years(d)) *
                 static_cast<double>(units::nanoseconds_per_year) +
             static_cast<double>(d.total_nanoseconds()) +
             yocto / static_cast<double>(units::yoctoseconds_per_nanosecond);
    }

    double
    years_double(const duration& d) {
      double fraction = (static_cast<double>(d.total_nanoseconds()) +
                         (static_cast<double>(d.total_yoctoseconds()) +
                          static_cast<double>(d.planck_time()) /
                              units::planck_time_per_yoctosecond_double) /
                             static_cast<double>(
                                 units::yoctoseconds_per_nanosecond)) /
                        static_cast<double>(units::nanoseconds_per_year);
      return static_cast<double>(total_years(d)) + fraction;
    }

  } // namespace

  namespace detail {

    integer
    planck_time_per(time_unit unit) {
      const integer& ppy = planck_time_per_yoctosecond();
      integer per_nanosecond =
          ppy * integer(units::yoctoseconds_per_nanosecond);
      switch (unit) {
        case time_unit::aeon:
          return per_nanosecond * integer(units::nanoseconds_per_year) *
                 integer(units::years_per_aeon);
        case time_unit::year:
          return per_nanosecond * integer(units::nanoseconds_per_year);
        case time_unit::day:
        case time_unit::hour:
        case time_unit::minute:
        case time_unit::second:
        case time_unit::millisecond:
        case time_unit::microsecond:
        case time_unit::nanosecond:
          return per_nanosecond * integer(nanoseconds_per(unit));
        case time_unit::picosecond:
        case time_unit::femtosecond:
        case time_unit::attosecond:
        case time_unit::zeptosecond:
        case time_unit::yoctosecond:
          return ppy * integer(yoctoseconds_per(unit));
        case time_unit::planck_time: return integer(uint64_t{1});
      }
      throw std::invalid_argument("duration: unknown time unit");
    }

    integer
    total_in(const duration& d, time_unit unit) {
      switch (unit) {
        case time_unit::aeon: return d.aeons();
        case time_unit::year: return total_years(d);
        case time_unit::second:
          return total_nanoseconds(d) /
                 integer(units::nanoseconds_per_second);
        case time_unit::nanosecond: return total_nanoseconds(d);
        case time_unit::yoctosecond: return total_yoctoseconds(d);
        case time_unit::planck_time:
          return total_yoctoseconds(d) * planck_time_per_yoctosecond() +
                 d.planck_time();
        default:
          throw std::invalid_argument("duration: unsupported total unit");
      }
    }

  } // namespace detail

  duration
  duration::from(time_unit unit, const integer& value) {
    bool negative = value.is_negative();
    integer count = value.abs();
    integer none;

    switch (unit) {
      case time_unit::aeon:
        return normalize(negative, count, none, none, none, none);
      case time_unit::year:
        return normalize(negative, none, count, none, none, none);
      case time_unit::day:
      case time_unit::hour:
      case time_unit::minute:
      case time_unit::second:
      case time_unit::millisecond:
      case time_unit::microsecond:
      case time_unit::nanosecond:
        return normalize(negative, none, none,
                         count * integer(nanoseconds_per(unit)), none, none);
      case time_unit::picosecond:
      case time_unit::femtosecond:
      case time_unit::attosecond:
      case time_unit::zeptosecond:
      case time_unit::yoctosecond:
        return normalize(negative, none, none, none,
                         count * integer(yoctoseconds_per(unit)), none);
      case time_unit::planck_time:
        return normalize(negative, none, none, none, none, count);
    }
    throw std::invalid_argument("duration: unknown time unit");
  }

  duration
  duration::from(time_unit unit, const decimal& value) {
    decimal magnitude = value.abs();
    detail::check_count(magnitude);
    integer whole = magnitude.floor();
    decimal fraction = magnitude.fraction();

    duration result = from(unit, whole);
    if (!fraction.is_zero()) {
      // Sub-unit remainder lands on the Planck-time grid, truncated.
      integer planck =
          (fraction * decimal(detail::planck_time_per(unit))).floor();
      result = result.add(from(time_unit::planck_time, planck));
    }
    return value.is_negative() ? result.negate() : result;
  }

  duration
  duration::from(time_unit unit, double value) {
    if (std::isnan(value)) {
      throw std::invalid_argument("duration: value is NaN");
    }
    if (std::isinf(value)) {
      return value < 0 ? negative_infinity() : positive_infinity();
    }
    return from(unit, decimal(value));
  }

  double
  duration::to(time_unit unit) const {
    double magnitude = 0.0;
    if (perpetual_) {
      magnitude = std::numeric_limits<double>::infinity();
    } else {
      switch (unit) {
        case time_unit::aeon:
          magnitude = years_double(*this) /
                      static_cast<double>(units::years_per_aeon);
          break;
        case time_unit::year: magnitude = years_double(*this); break;
        case time_unit::day:
        case time_unit::hour:
        case time_unit::minute:
        case time_unit::second:
        case time_unit::millisecond:
        case time_unit::microsecond:
        case time_unit::nanosecond:
          magnitude = nanoseconds_double(*this) /
                      static_cast<double>(nanoseconds_per(unit));
          break;
        case time_unit::picosecond:
        case time_unit::femtosecond:
        case time_unit::attosecond:
        case time_unit::zeptosecond:
        case time_unit::yoctosecond:
          magnitude = nanoseconds_double(*this) *
                      static_cast<double>(units::yoctoseconds_per_nanosecond) /
                      static_cast<double>(yoctoseconds_per(unit));
          break;
        case time_unit::planck_time:
          magnitude = static_cast<double>(
              detail::total_in(*this, time_unit::planck_time));
          break;
      }
    }
    return negative_ ? -magnitude : magnitude;
  }

} // namespace kairos
