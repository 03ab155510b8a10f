#pragma once

#include <kairos/duration.hpp>
#include <kairos/relative_duration.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

// JSON carries durations as their lossless round-trip string ("o" pattern),
// and relative proportions as "Dx<p>" or "Yx<p>". Any other JSON shape or
// text is rejected with std::invalid_argument.

namespace nlohmann {

  template <>
  struct adl_serializer<kairos::duration> {
    static void
    to_json(json& j, const kairos::duration& d) {
      j = d.to_string("o");
    }

    static kairos::duration
    from_json(const json& j) {
      if (!j.is_string()) {
        throw std::invalid_argument("duration: JSON value must be a string");
      }
      return kairos::duration::parse_exact(j.get<std::string>(), "o");
    }
  };

  template <>
  struct adl_serializer<kairos::relative_duration> {
    static void
    to_json(json& j, const kairos::relative_duration& r) {
      j = r.to_string("o");
    }

    static kairos::relative_duration
    from_json(const json& j) {
      if (!j.is_string()) {
        throw std::invalid_argument(
            "relative_duration: JSON value must be a string");
      }
      auto text = j.get<std::string>();
      if (text.starts_with("Dx") || text.starts_with("Yx")) {
        return kairos::relative_duration::parse(text);
      }
      return kairos::relative_duration(
          kairos::duration::parse_exact(text, "o"));
    }
  };

} // namespace nlohmann
