#include <kairos/duration.hpp>

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

using kairos::duration;
using kairos::integer;
using kairos::time_unit;
namespace units = kairos::units;

namespace {

  const integer planck_radix(units::planck_time_per_yoctosecond);

  duration
  sample() {
    duration::components c;
    c.years = 1;
    c.days = 2;
    c.hours = 3;
    c.minutes = 4;
    c.seconds = 5;
    c.milliseconds = 6;
    c.microseconds = 7;
    c.nanoseconds = 8;
    c.picoseconds = 9;
    c.femtoseconds = 10;
    c.attoseconds = 11;
    c.zeptoseconds = 12;
    c.yoctoseconds = 13;
    c.planck_time = integer(uint64_t{14});
    return duration::from_components(c);
  }

} // namespace

TEST_CASE("duration default construction is zero", "[duration]") {
  duration d;
  CHECK(d.is_zero());
  CHECK_FALSE(d.is_negative());
  CHECK_FALSE(d.is_perpetual());
  CHECK(d.sign() == 0);
  CHECK(d == duration::zero());
}

TEST_CASE("duration component views", "[duration]") {
  auto d = sample();
  CHECK(d.aeons().is_zero());
  CHECK(d.years() == 1);
  CHECK(d.days() == 2);
  CHECK(d.hours() == 3);
  CHECK(d.minutes() == 4);
  CHECK(d.seconds() == 5);
  CHECK(d.milliseconds() == 6);
  CHECK(d.microseconds() == 7);
  CHECK(d.nanoseconds() == 8);
  CHECK(d.picoseconds() == 9);
  CHECK(d.femtoseconds() == 10);
  CHECK(d.attoseconds() == 11);
  CHECK(d.zeptoseconds() == 12);
  CHECK(d.yoctoseconds() == 13);
  CHECK(d.planck_time() == integer(uint64_t{14}));
  CHECK(d.total_nanoseconds() == 183845006007008ULL);
  CHECK(d.total_yoctoseconds() == 9010011012013ULL);
}

TEST_CASE("from_components carries overflow into coarser fields",
          "[duration]") {
  SECTION("days past one year") {
    duration::components c;
    c.days = 366;
    auto d = duration::from_components(c);
    CHECK(d.years() == 1);
    CHECK(d.days() == 0);
    CHECK(d.hours() == 18);
  }
  SECTION("Planck time past one yoctosecond") {
    duration::components c;
    c.planck_time = planck_radix + integer(uint64_t{5});
    auto d = duration::from_components(c);
    CHECK(d.total_yoctoseconds() == 1);
    CHECK(d.planck_time() == integer(uint64_t{5}));
  }
  SECTION("yoctoseconds past one nanosecond") {
    duration::components c;
    c.picoseconds = 1500;
    auto d = duration::from_components(c);
    CHECK(d.total_nanoseconds() == 1);
    CHECK(d.picoseconds() == 500);
  }
  SECTION("years past one aeon") {
    duration::components c;
    c.years = units::years_per_aeon + 7;
    auto d = duration::from_components(c);
    CHECK(d.aeons() == integer(uint64_t{1}));
    CHECK(d.years() == 7);
  }
  SECTION("every field at once") {
    duration::components c;
    c.hours = 24;
    c.minutes = 60;
    c.seconds = 60;
    auto d = duration::from_components(c);
    CHECK(d.days() == 1);
    CHECK(d.hours() == 1);
    CHECK(d.minutes() == 1);
    CHECK(d.seconds() == 0);
  }
}

TEST_CASE("from_components rejects invalid input", "[duration]") {
  SECTION("negative aeons") {
    duration::components c;
    c.aeons = integer(int64_t{-1});
    CHECK_THROWS_AS(duration::from_components(c), std::invalid_argument);
  }
  SECTION("negative Planck time") {
    duration::components c;
    c.planck_time = integer(int64_t{-1});
    CHECK_THROWS_AS(duration::from_components(c), std::invalid_argument);
  }
  SECTION("aeon magnitude beyond the supported range") {
    duration::components c;
    c.aeons = integer::pow10(5000);
    CHECK_THROWS_AS(duration::from_components(c), std::overflow_error);
  }
}

TEST_CASE("negative zero normalizes to zero", "[duration]") {
  duration::components c;
  c.negative = true;
  auto d = duration::from_components(c);
  CHECK(d.is_zero());
  CHECK_FALSE(d.is_negative());
  CHECK(d == duration::zero());

  auto canonical =
      duration::from_canonical_fields(true, false, integer(), 0, 0, 0,
                                      integer());
  CHECK_FALSE(canonical.is_negative());
  CHECK(duration::zero().negate() == duration::zero());
}

TEST_CASE("from_canonical_fields stores fields as given", "[duration]") {
  SECTION("in-range fields") {
    auto d = duration::from_canonical_fields(
        true, false, integer(uint64_t{14}), 9010011012013ULL,
        183845006007008ULL, 1, integer());
    CHECK(d == sample().negate());
  }
  SECTION("perpetual clears the magnitude") {
    auto d = duration::from_canonical_fields(false, true, integer(uint64_t{1}),
                                             1, 1, 1, integer(uint64_t{1}));
    CHECK(d.is_positive_infinity());
    CHECK(d.years() == 0);
    CHECK(d.aeons().is_zero());
    CHECK(d == duration::positive_infinity());
  }
  SECTION("out-of-range fields are rejected") {
    CHECK_THROWS_AS(duration::from_canonical_fields(false, false, planck_radix,
                                                    0, 0, 0, integer()),
                    std::invalid_argument);
    CHECK_THROWS_AS(duration::from_canonical_fields(
                        false, false, integer(),
                        units::yoctoseconds_per_nanosecond, 0, 0, integer()),
                    std::invalid_argument);
    CHECK_THROWS_AS(duration::from_canonical_fields(
                        false, false, integer(), 0,
                        units::nanoseconds_per_year, 0, integer()),
                    std::invalid_argument);
    CHECK_THROWS_AS(duration::from_canonical_fields(
                        false, false, integer(), 0, 0,
                        units::years_per_aeon, integer()),
                    std::invalid_argument);
    CHECK_THROWS_AS(duration::from_canonical_fields(false, false, integer(), 0,
                                                    0, 0,
                                                    integer(int64_t{-1})),
                    std::invalid_argument);
  }
}

TEST_CASE("named unit constants", "[duration]") {
  CHECK(duration::one(time_unit::aeon).aeons() == integer(uint64_t{1}));
  CHECK(duration::one(time_unit::year).years() == 1);
  CHECK(duration::one(time_unit::day).total_nanoseconds() ==
        units::nanoseconds_per_day);
  CHECK(duration::one(time_unit::hour).hours() == 1);
  CHECK(duration::one(time_unit::minute).minutes() == 1);
  CHECK(duration::one(time_unit::second).seconds() == 1);
  CHECK(duration::one(time_unit::millisecond).milliseconds() == 1);
  CHECK(duration::one(time_unit::microsecond).microseconds() == 1);
  CHECK(duration::one(time_unit::nanosecond).nanoseconds() == 1);
  CHECK(duration::one(time_unit::picosecond).picoseconds() == 1);
  CHECK(duration::one(time_unit::femtosecond).femtoseconds() == 1);
  CHECK(duration::one(time_unit::attosecond).attoseconds() == 1);
  CHECK(duration::one(time_unit::zeptosecond).zeptoseconds() == 1);
  CHECK(duration::one(time_unit::yoctosecond).yoctoseconds() == 1);
  CHECK(duration::one(time_unit::planck_time).planck_time() ==
        integer(uint64_t{1}));
}

TEST_CASE("perpetual durations", "[duration]") {
  auto pos = duration::positive_infinity();
  auto neg = duration::negative_infinity();

  CHECK(pos.is_perpetual());
  CHECK(pos.is_positive_infinity());
  CHECK_FALSE(pos.is_negative_infinity());
  CHECK(neg.is_negative_infinity());
  CHECK_FALSE(pos.is_zero());
  CHECK(pos.sign() == 1);
  CHECK(neg.sign() == -1);
  CHECK(pos.negate() == neg);
  CHECK(neg.abs() == pos);
}

TEST_CASE("duration ordering", "[duration]") {
  auto second = duration::one(time_unit::second);
  auto year = duration::one(time_unit::year);
  auto aeon = duration::one(time_unit::aeon);
  auto planck = duration::one(time_unit::planck_time);

  SECTION("magnitudes") {
    CHECK(planck < second);
    CHECK(second < year);
    CHECK(year < aeon);
    CHECK(duration::zero() < planck);
  }
  SECTION("signs") {
    CHECK(-second < duration::zero());
    CHECK(-aeon < -year);
    CHECK(-planck > -second);
    CHECK(-aeon < planck);
  }
  SECTION("perpetual values bound every finite value") {
    CHECK(duration::positive_infinity() > aeon * integer::pow10(100));
    CHECK(duration::negative_infinity() < -(aeon * integer::pow10(100)));
    CHECK(duration::negative_infinity() < duration::positive_infinity());
    CHECK((duration::positive_infinity() <=> duration::positive_infinity()) ==
          std::strong_ordering::equal);
  }
  SECTION("comparison is antisymmetric") {
    CHECK((second <=> year) == std::strong_ordering::less);
    CHECK((year <=> second) == std::strong_ordering::greater);
    CHECK((-second <=> -year) == std::strong_ordering::greater);
    CHECK((-year <=> -second) == std::strong_ordering::less);
  }
  SECTION("max and min") {
    CHECK(duration::max(second, year) == year);
    CHECK(duration::min(second, year) == second);
    CHECK(duration::max(-second, -year) == -second);
  }
}

TEST_CASE("duration unit conversion", "[duration]") {
  using Catch::Detail::Approx;

  SECTION("to") {
    CHECK(duration::one(time_unit::day).to(time_unit::hour) == Approx(24.0));
    CHECK(duration::one(time_unit::year).to(time_unit::day) ==
          Approx(365.25));
    CHECK(duration::one(time_unit::aeon).to(time_unit::year) == Approx(1e9));
    CHECK(duration::one(time_unit::nanosecond).to(time_unit::picosecond) ==
          Approx(1000.0));
    CHECK(duration::one(time_unit::yoctosecond).to(time_unit::planck_time) ==
          Approx(1.854861e20));
    CHECK((-duration::one(time_unit::minute)).to(time_unit::second) ==
          Approx(-60.0));
    CHECK(std::isinf(duration::positive_infinity().to(time_unit::second)));
    CHECK(duration::negative_infinity().to(time_unit::year) < 0);
  }
  SECTION("from integer") {
    auto d = duration::from(time_unit::minute, integer(int64_t{-90}));
    CHECK(d.is_negative());
    CHECK(d.hours() == 1);
    CHECK(d.minutes() == 30);
  }
  SECTION("from decimal folds the fraction down") {
    CHECK(duration::from(time_unit::hour, kairos::decimal("1.5")) ==
          duration::from(time_unit::minute, integer(int64_t{90})));
    CHECK(duration::from(time_unit::aeon, kairos::decimal("0.5")).years() ==
          500000000);
    CHECK(duration::from(time_unit::nanosecond, kairos::decimal("0.001")) ==
          duration::one(time_unit::picosecond));
  }
  SECTION("from double") {
    CHECK(duration::from(time_unit::second, 0.25) ==
          duration::from(time_unit::millisecond, integer(int64_t{250})));
    CHECK(duration::from(time_unit::day, -2.0) ==
          -duration::from(time_unit::day, integer(int64_t{2})));
    CHECK(duration::from(time_unit::second,
                         std::numeric_limits<double>::infinity()) ==
          duration::positive_infinity());
    CHECK_THROWS_AS(duration::from(time_unit::second,
                                   std::numeric_limits<double>::quiet_NaN()),
                    std::invalid_argument);
  }
}

TEST_CASE("duration hashing and streaming", "[duration]") {
  std::unordered_set<duration> set;
  set.insert(sample());
  set.insert(sample());
  set.insert(sample().negate());
  CHECK(set.size() == 2);

  std::ostringstream os;
  os << sample();
  CHECK(os.str() == "1 2 03:04:05");
}
