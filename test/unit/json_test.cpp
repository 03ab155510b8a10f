#include <kairos/json.hpp>

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using kairos::duration;
using kairos::integer;
using kairos::relative_duration;
using kairos::time_unit;
using nlohmann::json;

namespace {

  duration
  minutes(int64_t n) {
    return duration::from(time_unit::minute, integer(n));
  }

} // namespace

TEST_CASE("duration serializes as its round-trip string", "[json]") {
  json j = minutes(90);
  CHECK(j.is_string());
  CHECK(j.get<std::string>() == "0-5400000000000:0:0");

  CHECK(json(duration::negative_infinity()).get<std::string>() ==
        "-Infinity");
}

TEST_CASE("duration deserializes from its round-trip string", "[json]") {
  auto d = json("0-5400000000000:0:0").get<duration>();
  CHECK(d == minutes(90));

  auto far = duration::one(time_unit::aeon) * integer::pow10(40) -
             duration::one(time_unit::planck_time);
  CHECK(json(far).get<duration>() == far);
}

TEST_CASE("durations nest inside containers", "[json]") {
  std::map<std::string, duration> schedule = {
      {"lunch", minutes(45)},
      {"forever", duration::positive_infinity()},
  };
  json j = schedule;
  CHECK(j["lunch"] == "0-2700000000000:0:0");

  auto back = j.get<std::map<std::string, duration>>();
  CHECK(back == schedule);

  std::vector<duration> list = {minutes(1), -minutes(1)};
  CHECK(json(list).get<std::vector<duration>>() == list);
}

TEST_CASE("duration rejects other JSON shapes", "[json]") {
  CHECK_THROWS_AS(json(42).get<duration>(), std::invalid_argument);
  CHECK_THROWS_AS(json::object().get<duration>(), std::invalid_argument);
  CHECK_THROWS_AS(json("1 2 03:04:05").get<duration>(), std::invalid_argument);
}

TEST_CASE("relative_duration serializes through its text form", "[json]") {
  json season = relative_duration::one_season();
  CHECK(season.get<std::string>() == "Yx0.25");
  CHECK(season.get<relative_duration>() == relative_duration::one_season());

  json absolute = relative_duration(minutes(90));
  CHECK(absolute.get<std::string>() == "0-5400000000000:0:0");
  CHECK(absolute.get<relative_duration>() == minutes(90));

  CHECK_THROWS_AS(json(true).get<relative_duration>(), std::invalid_argument);
}

TEST_CASE("relative_duration reads only the round-trip forms", "[json]") {
  CHECK_THROWS_AS(json("1 2 03:04:05").get<relative_duration>(),
                  std::invalid_argument);
  CHECK_THROWS_AS(json("1 h 30 min").get<relative_duration>(),
                  std::invalid_argument);
  CHECK_THROWS_AS(json("Dx").get<relative_duration>(), std::invalid_argument);
  CHECK(json("Dx0.5").get<relative_duration>() ==
        relative_duration::proportion_of_day(kairos::decimal("0.5")));
  CHECK(json("Infinity").get<relative_duration>().is_perpetual());
}
