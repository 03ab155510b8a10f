#include "duration_pattern.hpp"

#include <optional>

namespace kairos::detail {

  namespace {

    std::optional<format_unit>
    unit_for_letter(char c) {
      switch (c) {
        case 'e': return format_unit::total_years;
        case 'y': return format_unit::years;
        case 'd': return format_unit::days;
        case 'h':
        case 'H': return format_unit::hours;
        case 'm': return format_unit::minutes;
        case 's': return format_unit::seconds;
        case 'F': return format_unit::fraction;
        case 'M': return format_unit::milliseconds;
        case 'u': return format_unit::microseconds;
        case 'n': return format_unit::nanoseconds;
        case 'p': return format_unit::picoseconds;
        case 'f': return format_unit::femtoseconds;
        case 'a': return format_unit::attoseconds;
        case 'z': return format_unit::zeptoseconds;
        case 'Y': return format_unit::yoctoseconds;
        case 'P': return format_unit::planck_time;
        default: return std::nullopt;
      }
    }

    void
    append_literal(std::vector<pattern_token>& tokens, std::string_view text) {
      if (text.empty()) { return; }
      if (!tokens.empty() && tokens.back().unit == format_unit::literal) {
        tokens.back().text.append(text);
        return;
      }
      tokens.push_back({format_unit::literal, 0, std::string(text)});
    }

  } // namespace

  bool
  is_blank(std::string_view text) {
    for (char c : text) {
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' &&
          c != '\v') {
        return false;
      }
    }
    return true;
  }

  resolved_pattern
  resolve_pattern(std::string_view pattern) {
    if (is_blank(pattern)) { pattern = "G"; }
    if (pattern.size() != 1) { return {false, std::string(pattern)}; }

    switch (pattern[0]) {
      case 'd': return {false, "y d"};
      case 'D': return {false, "e d"};
      case 'E':
        return {false, "y d HH:mm:ss:MMM:uuu:nnn:ppp:fff:aaa:zzz:YYY:PPP"};
      case 'f': return {false, "e d HH:mm"};
      case 'F': return {false, "e d HH:mm:ss"};
      case 'g': return {false, "y d HH:mm"};
      case 'o':
      case 'O': return {false, "e'-'n':'Y':'P"};
      case 't': return {false, "HH:mm"};
      case 'T': return {false, "HH:mm:ss"};
      case 'X': return {true, {}};
      default: return {false, "y d HH:mm:ss"};
    }
  }

  std::vector<pattern_token>
  tokenize_pattern(std::string_view pattern, const format_info& info) {
    std::vector<pattern_token> tokens;
    std::size_t pos = 0;
    while (pos < pattern.size()) {
      char c = pattern[pos];

      if (c == '\'' || c == '"') {
        std::size_t close = pattern.find(c, pos + 1);
        if (close == std::string_view::npos) { close = pattern.size(); }
        append_literal(tokens, pattern.substr(pos + 1, close - pos - 1));
        pos = close + 1;
        continue;
      }
      if (c == '\\') {
        if (pos + 1 < pattern.size()) {
          append_literal(tokens, pattern.substr(pos + 1, 1));
          pos += 2;
        } else {
          append_literal(tokens, "\\");
          ++pos;
        }
        continue;
      }
      if (c == '%') {
        ++pos;
        continue;
      }
      if (c == ':') {
        append_literal(tokens, info.time_separator);
        ++pos;
        continue;
      }
      if (c == '/') {
        append_literal(tokens, info.date_separator);
        ++pos;
        continue;
      }

      auto unit = unit_for_letter(c);
      if (!unit) {
        append_literal(tokens, pattern.substr(pos, 1));
        ++pos;
        continue;
      }

      std::size_t end = pos;
      while (end < pattern.size() && pattern[end] == c) { ++end; }
      tokens.push_back({*unit, end - pos, {}});
      pos = end;
    }
    return tokens;
  }

} // namespace kairos::detail
