/**
 * @file time_axis.cpp
 * @brief Timestamp parsing and time axis lookup.
 * @author Watosn
 */

#include "resx/core/time_axis.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

namespace resx::core {
namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  d = doy - (153U * mp + 2U) / 5U + 1U;
  m = mp < 10U ? mp + 3U : mp - 9U;
  y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400) + static_cast<int>(m <= 2U);
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int y, unsigned m) {
  constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2U && is_leap(y)) ? 29U : kDays[m - 1U];
}

// Fixed-width unsigned field; advances `pos` on success.
bool take_digits(std::string_view text, std::size_t& pos, std::size_t width, unsigned& out) {
  if (pos + width > text.size()) {
    return false;
  }
  const char* first = text.data() + pos;
  const char* last = first + width;
  if (!std::all_of(first, last, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) {
    return false;
  }
  pos += width;
  return true;
}

bool take_char(std::string_view text, std::size_t& pos, char c) {
  if (pos < text.size() && text[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace

std::optional<Timestamp> parse_timestamp(std::string_view raw) {
  const std::string_view text = trim(raw);
  std::size_t pos = 0;
  unsigned year = 0;
  unsigned month = 0;
  unsigned day = 0;
  if (!take_digits(text, pos, 4, year) || !take_char(text, pos, '-') || !take_digits(text, pos, 2, month) ||
      !take_char(text, pos, '-') || !take_digits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (month < 1U || month > 12U || day < 1U || day > days_in_month(static_cast<int>(year), month)) {
    return std::nullopt;
  }

  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;
  if (take_char(text, pos, 'T') || take_char(text, pos, ' ')) {
    if (!take_digits(text, pos, 2, hour) || !take_char(text, pos, ':') || !take_digits(text, pos, 2, minute)) {
      return std::nullopt;
    }
    if (take_char(text, pos, ':') && !take_digits(text, pos, 2, second)) {
      return std::nullopt;
    }
    if (hour > 23U || minute > 59U || second > 59U) {
      return std::nullopt;
    }
  }

  std::int64_t offset_s = 0;
  if (pos < text.size()) {
    if (take_char(text, pos, 'Z')) {
      offset_s = 0;
    } else if (text[pos] == '+' || text[pos] == '-') {
      const bool negative = text[pos] == '-';
      ++pos;
      unsigned oh = 0;
      unsigned om = 0;
      if (!take_digits(text, pos, 2, oh)) {
        return std::nullopt;
      }
      static_cast<void>(take_char(text, pos, ':'));  // optional separator
      if (!take_digits(text, pos, 2, om) || oh > 23U || om > 59U) {
        return std::nullopt;
      }
      offset_s = (negative ? -1 : 1) * static_cast<std::int64_t>(oh * 3600U + om * 60U);
    }
    if (pos != text.size()) {
      return std::nullopt;
    }
  }

  const std::int64_t days = days_from_civil(static_cast<int>(year), month, day);
  const std::int64_t local = days * kSecondsPerDay + static_cast<std::int64_t>(hour * 3600U + minute * 60U + second);
  return Timestamp{.utc_seconds = local - offset_s};
}

CivilTime to_civil(const Timestamp& t) {
  std::int64_t days = t.utc_seconds / kSecondsPerDay;
  std::int64_t rem = t.utc_seconds % kSecondsPerDay;
  if (rem < 0) {
    rem += kSecondsPerDay;
    days -= 1;
  }
  CivilTime out{};
  civil_from_days(days, out.year, out.month, out.day);
  out.hour = static_cast<unsigned>(rem / 3600);
  out.minute = static_cast<unsigned>((rem % 3600) / 60);
  out.second = static_cast<unsigned>(rem % 60);
  return out;
}

std::string format_timestamp(const Timestamp& t) {
  const CivilTime c = to_civil(t);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}+00:00", c.year, c.month, c.day, c.hour, c.minute,
                     c.second);
}

std::optional<TimeAxis> TimeAxis::FromTimestamps(std::vector<Timestamp> stamps) {
  for (std::size_t i = 1; i < stamps.size(); ++i) {
    if (!(stamps[i - 1] < stamps[i])) {
      return std::nullopt;
    }
  }
  return TimeAxis(std::move(stamps));
}

std::optional<TimeAxis> TimeAxis::FromStrings(const std::vector<std::string>& stamps) {
  std::vector<Timestamp> parsed;
  parsed.reserve(stamps.size());
  for (const auto& s : stamps) {
    const auto t = parse_timestamp(s);
    if (!t.has_value()) {
      return std::nullopt;
    }
    parsed.push_back(*t);
  }
  return FromTimestamps(std::move(parsed));
}

std::optional<std::size_t> TimeAxis::find(const Timestamp& t) const noexcept {
  const auto it = std::lower_bound(stamps_.begin(), stamps_.end(), t);
  if (it == stamps_.end() || *it != t) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(stamps_.begin(), it));
}

PositionResult TimeAxis::position_of(std::string_view text) const {
  const auto t = parse_timestamp(text);
  if (!t.has_value()) {
    return PositionResult{.status = Status::InvalidInput};
  }
  const auto pos = find(*t);
  if (!pos.has_value()) {
    return PositionResult{.status = Status::NotFound};
  }
  return PositionResult{.position = *pos};
}

std::vector<std::size_t> TimeAxis::positions_in_years(const std::vector<int>& years) const {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < stamps_.size(); ++i) {
    const int y = to_civil(stamps_[i]).year;
    if (std::find(years.begin(), years.end(), y) != years.end()) {
      out.push_back(i);
    }
  }
  return out;
}

std::vector<int> TimeAxis::years() const {
  std::vector<int> out;
  for (const auto& t : stamps_) {
    const int y = to_civil(t).year;
    if (out.empty() || out.back() != y) {
      out.push_back(y);
    }
  }
  return out;
}

std::optional<TimeAxis> TimeAxis::concat(const TimeAxis& other) const {
  std::vector<Timestamp> merged = stamps_;
  merged.insert(merged.end(), other.stamps_.begin(), other.stamps_.end());
  return FromTimestamps(std::move(merged));
}

std::optional<int> parse_year(std::string_view name) {
  const auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  std::size_t i = 0;
  while (i < name.size()) {
    if (!is_digit(name[i])) {
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < name.size() && is_digit(name[j])) {
      ++j;
    }
    if (j - i == 4 && (name.substr(i, 2) == "19" || name.substr(i, 2) == "20")) {
      int year = 0;
      const auto parsed = std::from_chars(name.data() + i, name.data() + j, year);
      if (parsed.ec == std::errc{}) {
        return year;
      }
    }
    i = j;
  }
  return std::nullopt;
}

}  // namespace resx::core
