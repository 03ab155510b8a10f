#include <kairos/duration.hpp>

#include "duration_detail.hpp"
#include "duration_pattern.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kairos {

  namespace {

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    bool
    all_digits(std::string_view text) {
      if (text.empty()) { return false; }
      for (char c : text) {
        if (!is_digit(c)) { return false; }
      }
      return true;
    }

    std::string
    without(std::string_view text, const std::string& separator) {
      std::string result(text);
      if (separator.empty()) { return result; }
      std::size_t pos = 0;
      while ((pos = result.find(separator, pos)) != std::string::npos) {
        result.erase(pos, separator.size());
      }
      return result;
    }

    std::string
    right_padded(std::string_view digits, std::size_t width) {
      std::string result(digits);
      if (result.size() < width) { result.append(width - result.size(), '0'); }
      return result;
    }

    // Running totals for the custom reader. Coarser units are folded into
    // the finest field of their width so normalization does the carrying.
    struct accumulators {
      integer years;
      integer nanoseconds;
      integer yoctoseconds;
      integer planck_time;

      void
      add_nanoseconds(const integer& count, uint64_t per_unit) {
        nanoseconds += count * integer(per_unit);
      }

      void
      add_yoctoseconds(const integer& count, uint64_t per_unit) {
        yoctoseconds += count * integer(per_unit);
      }

      // 9 digits of nanoseconds, 15 of yoctoseconds, the rest a fraction of
      // one yoctosecond.
      void
      add_fraction(std::string_view digits) {
        std::string_view nano = digits.substr(0, 9);
        nanoseconds += integer(right_padded(nano, 9));
        if (digits.size() <= 9) { return; }

        std::string_view yocto = digits.substr(9, 15);
        yoctoseconds += integer(right_padded(yocto, 15));
        if (digits.size() <= 24) { return; }

        decimal part("0." + std::string(digits.substr(24)));
        planck_time +=
            (part * decimal(detail::planck_time_per_yoctosecond())).floor();
      }

      duration
      build(bool negative) const {
        duration result = duration::from(time_unit::year, years)
                              .add(duration::from(time_unit::nanosecond,
                                                  nanoseconds))
                              .add(duration::from(time_unit::yoctosecond,
                                                  yoctoseconds))
                              .add(duration::from(time_unit::planck_time,
                                                  planck_time));
        return negative ? result.negate() : result;
      }
    };

    bool
    accumulate(accumulators& acc, const detail::pattern_token& token,
               std::string_view slice, const format_info& info) {
      using detail::format_unit;

      if (token.unit == format_unit::years) {
        std::string digits = without(slice, info.group_separator);
        if (!all_digits(digits)) { return false; }
        detail::check_count_digits(digits);
        acc.years += integer(digits);
        return true;
      }
      if (!all_digits(slice)) { return false; }
      if (token.unit == format_unit::fraction) {
        acc.add_fraction(slice);
        return true;
      }

      detail::check_count_digits(slice);
      integer value(slice);
      switch (token.unit) {
        case format_unit::total_years: acc.years += value; break;
        case format_unit::days:
          acc.add_nanoseconds(value, units::nanoseconds_per_day);
          break;
        case format_unit::hours:
          acc.add_nanoseconds(value, units::nanoseconds_per_hour);
          break;
        case format_unit::minutes:
          acc.add_nanoseconds(value, units::nanoseconds_per_minute);
          break;
        case format_unit::seconds:
          acc.add_nanoseconds(value, units::nanoseconds_per_second);
          break;
        case format_unit::milliseconds:
          acc.add_nanoseconds(value, units::nanoseconds_per_millisecond);
          break;
        case format_unit::microseconds:
          acc.add_nanoseconds(value, units::nanoseconds_per_microsecond);
          break;
        case format_unit::nanoseconds: acc.add_nanoseconds(value, 1); break;
        case format_unit::picoseconds:
          acc.add_yoctoseconds(value, units::yoctoseconds_per_picosecond);
          break;
        case format_unit::femtoseconds:
          acc.add_yoctoseconds(value, units::yoctoseconds_per_femtosecond);
          break;
        case format_unit::attoseconds:
          acc.add_yoctoseconds(value, units::yoctoseconds_per_attosecond);
          break;
        case format_unit::zeptoseconds:
          acc.add_yoctoseconds(value, units::yoctoseconds_per_zeptosecond);
          break;
        case format_unit::yoctoseconds: acc.add_yoctoseconds(value, 1); break;
        case format_unit::planck_time: acc.planck_time += value; break;
        default: return false;
      }
      return true;
    }

    std::optional<duration>
    read_custom(std::string_view text,
                const std::vector<detail::pattern_token>& tokens,
                const format_info& info) {
      using detail::format_unit;

      bool negative = false;
      if (!info.negative_sign.empty() &&
          text.substr(0, info.negative_sign.size()) == info.negative_sign) {
        negative = true;
        text.remove_prefix(info.negative_sign.size());
      }

      // Length of the literal tail following each position; a unit run
      // with only literals after it reads up to that tail.
      std::vector<std::size_t> trailing(tokens.size() + 1, 0);
      std::vector<bool> units_after(tokens.size() + 1, false);
      for (std::size_t i = tokens.size(); i-- > 0;) {
        bool literal = tokens[i].unit == format_unit::literal;
        units_after[i] = units_after[i + 1] || !literal;
        trailing[i] = trailing[i + 1] + (literal ? tokens[i].text.size() : 0);
      }

      accumulators acc;
      std::size_t pos = 0;
      for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        std::string_view rest = text.substr(pos);

        if (token.unit == format_unit::literal) {
          if (rest.substr(0, token.text.size()) != token.text) {
            return std::nullopt;
          }
          pos += token.text.size();
          continue;
        }

        std::size_t length = 0;
        if (!units_after[i + 1]) {
          if (rest.size() < trailing[i + 1]) { return std::nullopt; }
          length = rest.size() - trailing[i + 1];
        } else if (tokens[i + 1].unit == format_unit::literal) {
          std::size_t found = rest.find(tokens[i + 1].text);
          if (found == std::string_view::npos) { return std::nullopt; }
          length = found;
        } else if (token.count == 1 || token.count == 2) {
          length = token.count;
          if (rest.size() < length) { return std::nullopt; }
        } else {
          return std::nullopt;
        }

        if (!accumulate(acc, token, rest.substr(0, length), info)) {
          return std::nullopt;
        }
        pos += length;
      }
      if (pos != text.size()) { return std::nullopt; }

      return acc.build(negative);
    }

    std::optional<time_unit>
    unit_for_symbol(std::string_view symbol) {
      if (symbol == "y" || symbol == "a") { return time_unit::year; }
      if (symbol == "d") { return time_unit::day; }
      if (symbol == "h") { return time_unit::hour; }
      if (symbol == "min") { return time_unit::minute; }
      if (symbol == "s") { return time_unit::second; }
      if (symbol == "ms") { return time_unit::millisecond; }
      if (symbol == "\xCE\xBCs" || symbol == "us") {
        return time_unit::microsecond;
      }
      if (symbol == "ns") { return time_unit::nanosecond; }
      if (symbol == "ps") { return time_unit::picosecond; }
      if (symbol == "fs") { return time_unit::femtosecond; }
      if (symbol == "as") { return time_unit::attosecond; }
      if (symbol == "zs") { return time_unit::zeptosecond; }
      if (symbol == "ys") { return time_unit::yoctosecond; }
      if (symbol == "tP") { return time_unit::planck_time; }
      return std::nullopt;
    }

    std::optional<duration>
    read_extensible(std::string_view text, const format_info& info) {
      while (!text.empty() && is_space(text.front())) { text.remove_prefix(1); }
      while (!text.empty() && is_space(text.back())) { text.remove_suffix(1); }

      bool negative = false;
      if (!info.negative_sign.empty() &&
          text.substr(0, info.negative_sign.size()) == info.negative_sign) {
        negative = true;
        text.remove_prefix(info.negative_sign.size());
      }
      if (text == "0") { return duration::zero(); }

      auto starts_with = [&text](std::size_t pos, const std::string& s) {
        return !s.empty() && text.substr(pos, s.size()) == s;
      };

      duration result;
      bool any = false;
      std::size_t pos = 0;
      while (true) {
        while (pos < text.size() &&
               (is_space(text[pos]) || starts_with(pos, info.group_separator))) {
          pos += is_space(text[pos]) ? 1 : info.group_separator.size();
        }
        if (pos == text.size()) { break; }

        std::string number;
        while (pos < text.size()) {
          if (is_digit(text[pos])) {
            number.push_back(text[pos++]);
          } else if (starts_with(pos, info.decimal_separator)) {
            number.push_back('.');
            pos += info.decimal_separator.size();
          } else if (starts_with(pos, info.group_separator)) {
            pos += info.group_separator.size();
          } else if ((text[pos] == 'e' || text[pos] == 'E') && !number.empty()) {
            std::size_t next = pos + 1;
            if (next < text.size() && (text[next] == '+' || text[next] == '-')) {
              ++next;
            }
            if (next >= text.size() || !is_digit(text[next])) { break; }
            number.append(text.substr(pos, next - pos));
            pos = next;
          } else {
            break;
          }
        }
        auto value = decimal::try_parse(number);
        if (!value) { return std::nullopt; }

        while (pos < text.size() && is_space(text[pos])) { ++pos; }
        std::size_t start = pos;
        while (pos < text.size() && !is_space(text[pos]) &&
               !is_digit(text[pos])) {
          ++pos;
        }
        auto unit = unit_for_symbol(text.substr(start, pos - start));
        if (!unit) { return std::nullopt; }

        result += duration::from(*unit, *value);
        any = true;
      }
      if (!any) { return std::nullopt; }

      return negative ? result.negate() : result;
    }

  } // namespace

  std::optional<duration>
  duration::try_parse_exact(std::string_view text, std::string_view pattern,
                            const format_info& info) {
    if (detail::is_blank(text)) { return std::nullopt; }
    if (text == info.positive_infinity_symbol) { return positive_infinity(); }
    if (text == info.negative_infinity_symbol) { return negative_infinity(); }

    auto resolved = detail::resolve_pattern(pattern);
    if (resolved.extensible) { return read_extensible(text, info); }
    return read_custom(text, detail::tokenize_pattern(resolved.custom, info),
                       info);
  }

  duration
  duration::parse_exact(std::string_view text, std::string_view pattern,
                        const format_info& info) {
    auto result = try_parse_exact(text, pattern, info);
    if (!result) {
      throw std::invalid_argument("duration: cannot parse '" +
                                  std::string(text) + "' with pattern '" +
                                  std::string(pattern) + "'");
    }
    return *result;
  }

  std::optional<duration>
  duration::try_parse(std::string_view text, const format_info& info) {
    for (std::string_view pattern : {"o", "G", "E", "g", "D", "T", "d", "t",
                                     "X"}) {
      if (auto result = try_parse_exact(text, pattern, info)) { return result; }
    }
    return std::nullopt;
  }

  duration
  duration::parse(std::string_view text, const format_info& info) {
    auto result = try_parse(text, info);
    if (!result) {
      throw std::invalid_argument("duration: cannot parse '" +
                                  std::string(text) + "'");
    }
    return *result;
  }

} // namespace kairos
