#include <kairos/duration.hpp>

#include "duration_detail.hpp"
#include "duration_pattern.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace kairos {

  namespace {

    std::string
    padded(uint64_t value, std::size_t width) {
      std::string digits = std::to_string(value);
      if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
      }
      return digits;
    }

    std::string
    padded(const integer& value, std::size_t width) {
      std::string digits = value.to_string();
      if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
      }
      return digits;
    }

    std::string
    grouped(uint64_t value, const std::string& separator) {
      std::string digits = std::to_string(value);
      std::string result;
      std::size_t lead = digits.size() % 3;
      if (lead == 0) { lead = 3; }
      result.append(digits, 0, lead);
      for (std::size_t i = lead; i < digits.size(); i += 3) {
        result.append(separator);
        result.append(digits, i, 3);
      }
      return result;
    }

    // Exact digits for precision 1; otherwise at most `precision`
    // significant digits, switching to d.dddE+XX when the value has more.
    std::string
    general(const integer& value, std::size_t precision,
            const format_info& info) {
      std::string digits = value.to_string();
      if (precision <= 1 || digits.size() <= precision) { return digits; }

      auto dropped = static_cast<unsigned>(digits.size() - precision);
      integer scale = integer::pow10(dropped);
      auto [kept, rest] = integer::divmod(value, scale);
      if (rest + rest >= scale) { kept += integer(uint64_t{1}); }

      std::size_t exponent = digits.size() - 1;
      std::string mantissa = kept.to_string();
      if (mantissa.size() > precision) {
        mantissa.pop_back();
        ++exponent;
      }
      while (mantissa.size() > 1 && mantissa.back() == '0') {
        mantissa.pop_back();
      }

      std::string result(1, mantissa[0]);
      if (mantissa.size() > 1) {
        result += info.decimal_separator;
        result.append(mantissa, 1);
      }
      result += "E+";
      result += padded(static_cast<uint64_t>(exponent), 2);
      return result;
    }

    // Digits of the fractional second: nine for nanoseconds, fifteen for
    // yoctoseconds, then the Planck-time fraction of a yoctosecond.
    std::string
    fraction_digits(const duration& d, std::size_t count) {
      std::string digits =
          padded(d.total_nanoseconds() % units::nanoseconds_per_second, 9);
      digits += padded(d.total_yoctoseconds(), 15);
      if (count > digits.size()) {
        auto places = static_cast<unsigned>(count - digits.size());
        integer scaled = d.planck_time() * integer::pow10(places) /
                         detail::planck_time_per_yoctosecond();
        digits += padded(scaled, places);
      }
      digits.resize(count);
      return digits;
    }

    std::string
    write_custom(const duration& d,
                 const std::vector<detail::pattern_token>& tokens,
                 const format_info& info) {
      using detail::format_unit;

      std::string out;
      if (d.is_negative()) { out += info.negative_sign; }

      bool wrote_total_years = false;
      bool wrote_coarse_nanoseconds = false;
      bool wrote_coarse_yoctoseconds = false;

      for (const auto& token : tokens) {
        switch (token.unit) {
          case format_unit::literal: out += token.text; break;
          case format_unit::total_years:
            out += general(d.aeons() * integer(units::years_per_aeon) +
                               integer(uint64_t{d.years()}),
                           token.count, info);
            wrote_total_years = true;
            break;
          case format_unit::years: {
            uint64_t years = wrote_total_years ? 0 : d.years();
            if (years > 9999 && token.count <= 4) {
              out += grouped(years, info.group_separator);
            } else {
              out += padded(years, token.count);
            }
            break;
          }
          case format_unit::days:
            out += padded(d.days(), token.count);
            wrote_coarse_nanoseconds = true;
            break;
          case format_unit::hours:
            out += padded(d.hours(), token.count);
            wrote_coarse_nanoseconds = true;
            break;
          case format_unit::minutes:
            out += padded(d.minutes(), token.count);
            wrote_coarse_nanoseconds = true;
            break;
          case format_unit::seconds:
            out += padded(d.seconds(), token.count);
            wrote_coarse_nanoseconds = true;
            break;
          case format_unit::fraction:
            out += fraction_digits(d, token.count);
            break;
          case format_unit::milliseconds:
            out += padded(d.milliseconds(), token.count);
            wrote_coarse_nanoseconds = true;
            break;
          case format_unit::microseconds:
            out += padded(d.microseconds(), token.count);
            wrote_coarse_nanoseconds = true;
            break;
          case format_unit::nanoseconds:
            out += padded(wrote_coarse_nanoseconds ? d.nanoseconds()
                                                   : d.total_nanoseconds(),
                          token.count);
            break;
          case format_unit::picoseconds:
            out += padded(d.picoseconds(), token.count);
            wrote_coarse_yoctoseconds = true;
            break;
          case format_unit::femtoseconds:
            out += padded(d.femtoseconds(), token.count);
            wrote_coarse_yoctoseconds = true;
            break;
          case format_unit::attoseconds:
            out += padded(d.attoseconds(), token.count);
            wrote_coarse_yoctoseconds = true;
            break;
          case format_unit::zeptoseconds:
            out += padded(d.zeptoseconds(), token.count);
            wrote_coarse_yoctoseconds = true;
            break;
          case format_unit::yoctoseconds:
            out += padded(wrote_coarse_yoctoseconds ? d.yoctoseconds()
                                                    : d.total_yoctoseconds(),
                          token.count);
            break;
          case format_unit::planck_time:
            out += general(d.planck_time(), token.count, info);
            break;
        }
      }
      return out;
    }

    std::string
    write_extensible(const duration& d, const format_info& info) {
      if (d.is_zero()) { return "0"; }

      std::string out;
      auto unit = [&out](const std::string& value, const char* symbol) {
        if (!out.empty()) { out += ' '; }
        out += value;
        out += ' ';
        out += symbol;
      };
      auto part = [&unit](uint64_t value, const char* symbol) {
        if (value != 0) { unit(std::to_string(value), symbol); }
      };

      integer years =
          d.aeons() * integer(units::years_per_aeon) + integer(uint64_t{d.years()});
      if (!years.is_zero()) { unit(years.to_string(), "y"); }
      part(d.days(), "d");
      part(d.hours(), "h");
      part(d.minutes(), "min");
      part(d.seconds(), "s");
      part(d.milliseconds(), "ms");
      part(d.microseconds(), "\xCE\xBCs");
      part(d.nanoseconds(), "ns");
      part(d.picoseconds(), "ps");
      part(d.femtoseconds(), "fs");
      part(d.attoseconds(), "as");
      part(d.zeptoseconds(), "zs");
      part(d.yoctoseconds(), "ys");
      if (!d.planck_time().is_zero()) { unit(d.planck_time().to_string(), "tP"); }

      return d.is_negative() ? info.negative_sign + out : out;
    }

  } // namespace

  std::string
  duration::to_string(std::string_view pattern, const format_info& info) const {
    if (perpetual_) {
      return negative_ ? info.negative_infinity_symbol
                       : info.positive_infinity_symbol;
    }

    auto resolved = detail::resolve_pattern(pattern);
    if (resolved.extensible) { return write_extensible(*this, info); }
    return write_custom(*this, detail::tokenize_pattern(resolved.custom, info),
                        info);
  }

} // namespace kairos
