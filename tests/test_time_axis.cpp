/**
 * @file test_time_axis.cpp
 * @brief Timestamp parsing, time-axis position lookup and file-name year tests.
 * @author Watosn
 */

#include <vector>

#include <spdlog/spdlog.h>

#include "resx/core/time_axis.hpp"

int main() {
  using resx::core::Status;
  using resx::core::TimeAxis;

  const auto axis = TimeAxis::FromStrings({"2012-01-01T00:00", "2012-01-01T01:00"});
  if (!axis.has_value() || axis->size() != 2) {
    spdlog::error("axis construction failed");
    return 1;
  }

  const auto hit = axis->position_of("2012-01-01T01:00");
  if (hit.status != Status::Ok || hit.position != 1) {
    spdlog::error("exact lookup failed");
    return 2;
  }
  if (axis->position_of("2012-01-01T02:00").status != Status::NotFound ||
      axis->position_of("2012-01-01T00:30").status != Status::NotFound) {
    spdlog::error("absent timestamp was snapped to an entry");
    return 3;
  }
  if (axis->position_of("yesterday").status != Status::InvalidInput ||
      axis->position_of("2012-13-01").status != Status::InvalidInput ||
      axis->position_of("2012-02-30 00:00").status != Status::InvalidInput) {
    spdlog::error("unparseable timestamp accepted");
    return 4;
  }

  // Equivalent spellings resolve to the same entry.
  for (const char* text : {"2012-01-01 01:00:00", "2012-01-01T01:00:00Z", "2012-01-01T01:00:00+00:00",
                           "2012-01-01T03:00+02:00", "2011-12-31T20:00-0500", "  2012-01-01T01:00  "}) {
    const auto p = axis->position_of(text);
    if (p.status != Status::Ok || p.position != 1) {
      spdlog::error("spelling '{}' did not resolve", text);
      return 5;
    }
  }
  if (axis->position_of("2012-01-01").position != 0) {
    spdlog::error("date-only timestamp did not resolve to midnight");
    return 6;
  }

  const auto t = resx::core::parse_timestamp("2013-07-04T18:30:15");
  if (!t.has_value() || resx::core::format_timestamp(*t) != "2013-07-04 18:30:15+00:00") {
    spdlog::error("canonical formatting failed");
    return 7;
  }
  const auto civil = resx::core::to_civil(*t);
  if (civil.year != 2013 || civil.month != 7 || civil.day != 4 || civil.hour != 18 || civil.minute != 30 ||
      civil.second != 15) {
    spdlog::error("civil conversion failed");
    return 8;
  }

  if (TimeAxis::FromStrings({"2012-01-01T01:00", "2012-01-01T00:00"}).has_value() ||
      TimeAxis::FromStrings({"2012-01-01T00:00", "2012-01-01T00:00"}).has_value() ||
      TimeAxis::FromStrings({"2012-01-01T00:00", "garbage"}).has_value()) {
    spdlog::error("out-of-order or unparseable axis accepted");
    return 9;
  }

  const auto y2012 = TimeAxis::FromStrings({"2012-12-31T23:00", "2013-01-01T00:00", "2013-06-01T00:00"});
  const auto y2014 = TimeAxis::FromStrings({"2014-01-01T00:00"});
  if (!y2012.has_value() || !y2014.has_value() || y2012->years() != std::vector<int>{2012, 2013} ||
      y2012->positions_in_years({2013}) != std::vector<std::size_t>{1, 2} ||
      !y2012->positions_in_years({2015}).empty()) {
    spdlog::error("year positions failed");
    return 10;
  }
  const auto joined = y2012->concat(*y2014);
  if (!joined.has_value() || joined->size() != 4 || joined->position_of("2014-01-01").position != 3 ||
      y2014->concat(*y2012).has_value()) {
    spdlog::error("axis concatenation failed");
    return 11;
  }

  if (resx::core::parse_year("nsrdb_2012.h5") != 2012 || resx::core::parse_year("wtk_1999_conus.h5") != 1999 ||
      resx::core::parse_year("ri_100_wtk.h5").has_value() || resx::core::parse_year("run_20125.h5").has_value() ||
      resx::core::parse_year("v3012.h5").has_value()) {
    spdlog::error("file-name year parsing failed");
    return 12;
  }

  return 0;
}
