#include <kairos/relative_duration.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace kairos {

  namespace {

    constexpr std::string_view day_prefix = "Dx";
    constexpr std::string_view year_prefix = "Yx";

    decimal
    clamped(decimal proportion) {
      return proportion.is_negative() ? decimal() : proportion;
    }

  } // namespace

  relative_duration::relative_duration(duration d) : duration_(std::move(d)) {}

  relative_duration::relative_duration(decimal proportion,
                                       relative_type relativity)
      : relativity_(relativity), proportion_(clamped(std::move(proportion))) {
    if (relativity == relative_type::absolute) {
      throw std::invalid_argument(
          "relative_duration: a proportion needs a day or year relativity");
    }
  }

  relative_duration
  relative_duration::proportion_of_day(decimal proportion) {
    return {std::move(proportion), relative_type::proportion_of_day};
  }

  relative_duration
  relative_duration::proportion_of_year(decimal proportion) {
    return {std::move(proportion), relative_type::proportion_of_year};
  }

  relative_duration
  relative_duration::one_local_day() {
    return proportion_of_day(decimal(int64_t{1}));
  }

  relative_duration
  relative_duration::one_local_year() {
    return proportion_of_year(decimal(int64_t{1}));
  }

  relative_duration
  relative_duration::one_season() {
    return proportion_of_year(decimal(std::string_view("0.25")));
  }

  relative_type
  relative_duration::relativity() const {
    return relativity_;
  }

  const duration&
  relative_duration::absolute() const {
    return duration_;
  }

  const decimal&
  relative_duration::proportion() const {
    return proportion_;
  }

  bool
  relative_duration::is_zero() const {
    return relativity_ == relative_type::absolute ? duration_.is_zero()
                                                  : proportion_.is_zero();
  }

  bool
  relative_duration::is_perpetual() const {
    return relativity_ == relative_type::absolute && duration_.is_perpetual();
  }

  relative_duration
  relative_duration::multiply(double factor) const {
    if (std::isnan(factor)) {
      throw std::invalid_argument("relative_duration: scaling factor is NaN");
    }
    if (factor <= 0) { return relative_duration(); }
    if (is_perpetual() || std::isinf(factor)) {
      return relative_duration(duration::positive_infinity());
    }
    if (relativity_ == relative_type::absolute) {
      return relative_duration(duration_.multiply(factor));
    }
    return {proportion_ * decimal(factor), relativity_};
  }

  relative_duration
  relative_duration::divide(double divisor) const {
    if (std::isnan(divisor)) {
      throw std::invalid_argument("relative_duration: divisor is NaN");
    }
    if (is_zero()) { return relative_duration(); }
    if (is_perpetual() || divisor == 0.0) {
      return relative_duration(duration::positive_infinity());
    }
    if (divisor < 0 || std::isinf(divisor)) { return relative_duration(); }
    if (relativity_ == relative_type::absolute) {
      return relative_duration(duration_.divide(divisor));
    }
    return {proportion_ / decimal(divisor), relativity_};
  }

  duration
  relative_duration::to_duration(const duration& local_year,
                                 const duration& local_day) const {
    switch (relativity_) {
      case relative_type::absolute: return duration_;
      case relative_type::proportion_of_day:
        return local_day.multiply(proportion_);
      case relative_type::proportion_of_year:
        return local_year.multiply(proportion_);
    }
    throw std::invalid_argument("relative_duration: unknown relativity");
  }

  const relative_duration&
  relative_duration::max(const relative_duration& a,
                         const relative_duration& b,
                         const duration& local_year,
                         const duration& local_day) {
    return a.to_duration(local_year, local_day) >=
                   b.to_duration(local_year, local_day)
               ? a
               : b;
  }

  const relative_duration&
  relative_duration::min(const relative_duration& a,
                         const relative_duration& b,
                         const duration& local_year,
                         const duration& local_day) {
    return a.to_duration(local_year, local_day) <=
                   b.to_duration(local_year, local_day)
               ? a
               : b;
  }

  std::string
  relative_duration::to_string(std::string_view pattern,
                               const format_info& info) const {
    switch (relativity_) {
      case relative_type::absolute: return duration_.to_string(pattern, info);
      case relative_type::proportion_of_day:
        return std::string(day_prefix) + proportion_.to_string();
      case relative_type::proportion_of_year:
        return std::string(year_prefix) + proportion_.to_string();
    }
    return {};
  }

  std::optional<relative_duration>
  relative_duration::try_parse(std::string_view text, const format_info& info) {
    auto proportion_after = [&text](std::string_view prefix) {
      return decimal::try_parse(text.substr(prefix.size()));
    };

    if (text.substr(0, day_prefix.size()) == day_prefix) {
      auto proportion = proportion_after(day_prefix);
      if (!proportion) { return std::nullopt; }
      return proportion_of_day(std::move(*proportion));
    }
    if (text.substr(0, year_prefix.size()) == year_prefix) {
      auto proportion = proportion_after(year_prefix);
      if (!proportion) { return std::nullopt; }
      return proportion_of_year(std::move(*proportion));
    }

    auto absolute = duration::try_parse(text, info);
    if (!absolute) { return std::nullopt; }
    return relative_duration(std::move(*absolute));
  }

  relative_duration
  relative_duration::parse(std::string_view text, const format_info& info) {
    auto result = try_parse(text, info);
    if (!result) {
      throw std::invalid_argument("relative_duration: cannot parse '" +
                                  std::string(text) + "'");
    }
    return *result;
  }

  bool
  relative_duration::operator==(const relative_duration& other) const {
    return relativity_ == other.relativity_ && duration_ == other.duration_ &&
           proportion_ == other.proportion_;
  }

  bool
  relative_duration::operator==(const duration& other) const {
    return relativity_ == relative_type::absolute && duration_ == other;
  }

} // namespace kairos
