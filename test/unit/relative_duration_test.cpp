#include <kairos/relative_duration.hpp>

#include <catch2/catch.hpp>

#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

using kairos::decimal;
using kairos::duration;
using kairos::integer;
using kairos::relative_duration;
using kairos::relative_type;
using kairos::time_unit;

namespace {

  duration
  hours(int64_t n) {
    return duration::from(time_unit::hour, integer(n));
  }

  const duration year = duration::one(time_unit::year);
  const duration day = duration::one(time_unit::day);

} // namespace

TEST_CASE("relative_duration construction", "[relative_duration]") {
  SECTION("default is an absolute zero") {
    relative_duration r;
    CHECK(r.relativity() == relative_type::absolute);
    CHECK(r.is_zero());
    CHECK(r == duration::zero());
  }
  SECTION("absolute") {
    relative_duration r(hours(3));
    CHECK(r.relativity() == relative_type::absolute);
    CHECK(r.absolute() == hours(3));
    CHECK(r.proportion().is_zero());
    CHECK(r == hours(3));
  }
  SECTION("proportions") {
    auto r = relative_duration::proportion_of_day(decimal("0.25"));
    CHECK(r.relativity() == relative_type::proportion_of_day);
    CHECK(r.proportion() == decimal("0.25"));
    CHECK(r.absolute().is_zero());
    CHECK_FALSE(r == duration::zero());
  }
  SECTION("negative proportions clamp to zero") {
    auto r = relative_duration::proportion_of_year(decimal("-0.5"));
    CHECK(r.proportion().is_zero());
    CHECK(r.is_zero());
  }
  SECTION("a proportion needs a day or year relativity") {
    CHECK_THROWS_AS(relative_duration(decimal("0.5"), relative_type::absolute),
                    std::invalid_argument);
  }
  SECTION("named proportions") {
    CHECK(relative_duration::one_local_day().proportion() ==
          decimal(int64_t{1}));
    CHECK(relative_duration::one_local_year().relativity() ==
          relative_type::proportion_of_year);
    CHECK(relative_duration::one_season().proportion() == decimal("0.25"));
  }
}

TEST_CASE("relative_duration perpetual values", "[relative_duration]") {
  relative_duration forever(duration::positive_infinity());
  CHECK(forever.is_perpetual());
  CHECK_FALSE(relative_duration::one_local_year().is_perpetual());
}

TEST_CASE("relative_duration multiply", "[relative_duration]") {
  CHECK((relative_duration::one_local_day() * 2).to_string() == "Dx2.0");
  CHECK(relative_duration(hours(2)) * 1.5 ==
        duration::from(time_unit::minute, integer(int64_t{180})));
  CHECK((relative_duration::one_local_day() * -1).is_zero());
  CHECK((relative_duration::one_local_day() * 0).is_zero());
  CHECK((relative_duration::one_local_day() *
         std::numeric_limits<double>::infinity())
            .is_perpetual());
  CHECK((relative_duration(duration::positive_infinity()) * 3).is_perpetual());
  CHECK_THROWS_AS(relative_duration::one_local_day() *
                      std::numeric_limits<double>::quiet_NaN(),
                  std::invalid_argument);
}

TEST_CASE("relative_duration divide", "[relative_duration]") {
  CHECK(relative_duration::one_local_year() / 4 ==
        relative_duration::one_season());
  CHECK(relative_duration(hours(6)) / 2 == hours(3));
  CHECK((relative_duration::one_local_year() / 0).is_perpetual());
  CHECK((relative_duration::one_local_year() / -1).is_zero());
  CHECK((relative_duration::one_local_year() /
         std::numeric_limits<double>::infinity())
            .is_zero());
  CHECK((relative_duration() / 0).is_zero());
  CHECK((relative_duration(duration::positive_infinity()) / 2).is_perpetual());
  CHECK_THROWS_AS(relative_duration::one_local_day() /
                      std::numeric_limits<double>::quiet_NaN(),
                  std::invalid_argument);
}

TEST_CASE("relative_duration resolves against a local calendar",
          "[relative_duration]") {
  using Catch::Detail::Approx;

  CHECK(relative_duration::proportion_of_day(decimal("0.5"))
            .to_duration(year, hours(10)) == hours(5));
  CHECK(relative_duration::one_season().to_duration(year, day).to(
            time_unit::day) == Approx(91.3125));
  CHECK(relative_duration(hours(7)).to_duration(year, day) == hours(7));

  SECTION("max and min compare the resolved durations") {
    auto season = relative_duration::one_season();
    relative_duration week(duration::from(time_unit::day, integer(int64_t{7})));
    CHECK(relative_duration::max(season, week, year, day) == season);
    CHECK(relative_duration::min(season, week, year, day) == week);

    auto short_year = duration::from(time_unit::day, integer(int64_t{20}));
    CHECK(relative_duration::max(season, week, short_year, day) == week);
  }
}

TEST_CASE("relative_duration text", "[relative_duration]") {
  SECTION("format") {
    CHECK(relative_duration::one_season().to_string() == "Yx0.25");
    CHECK(relative_duration::proportion_of_day(decimal(0.25)).to_string() ==
          "Dx0.25");
    CHECK(relative_duration(hours(3)).to_string("T") == "03:00:00");

    std::ostringstream os;
    os << relative_duration::one_local_day();
    CHECK(os.str() == "Dx1.0");
  }
  SECTION("parse") {
    CHECK(relative_duration::parse("Yx0.25") ==
          relative_duration::one_season());
    CHECK(relative_duration::parse("Dx1") == relative_duration::one_local_day());
    CHECK(relative_duration::parse("03:00") == hours(3));
    CHECK(relative_duration::parse("Dx-2").is_zero());
    CHECK_FALSE(relative_duration::try_parse("Dx").has_value());
    CHECK_FALSE(relative_duration::try_parse("Yxabc").has_value());
    CHECK_THROWS_AS(relative_duration::parse("whenever"),
                    std::invalid_argument);
  }
}

TEST_CASE("relative_duration hashing", "[relative_duration]") {
  std::unordered_set<relative_duration> set;
  set.insert(relative_duration::one_season());
  set.insert(relative_duration::parse("Yx0.25"));
  set.insert(relative_duration::one_local_day());
  CHECK(set.size() == 2);
}
