/**
 * @file time_axis.hpp
 * @brief Calendar timestamps and the strictly increasing time axis of a collection.
 * @author Watosn
 */
#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "resx/core/types.hpp"

namespace resx::core {

/**
 * @brief UTC timestamp expressed as whole seconds since Unix epoch.
 */
struct Timestamp {
  std::int64_t utc_seconds{};

  friend bool operator==(const Timestamp&, const Timestamp&) = default;
  friend auto operator<=>(const Timestamp&, const Timestamp&) = default;
};

/**
 * @brief Broken-down UTC calendar fields.
 */
struct CivilTime {
  int year{};
  unsigned month{};
  unsigned day{};
  unsigned hour{};
  unsigned minute{};
  unsigned second{};
};

/**
 * @brief Parse a calendar timestamp into canonical UTC form.
 *
 * Accepts `YYYY-MM-DD`, optionally followed by `T` or a space and `HH:MM[:SS]`,
 * optionally followed by `Z` or a `+HH:MM`/`-HH:MM` offset.
 */
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

/**
 * @brief Canonical text form, `YYYY-MM-DD HH:MM:SS+00:00`.
 */
[[nodiscard]] std::string format_timestamp(const Timestamp& t);

[[nodiscard]] CivilTime to_civil(const Timestamp& t);

/**
 * @brief Result of resolving a timestamp on a time axis.
 */
struct PositionResult {
  std::size_t position{};
  Status status{Status::Ok};
};

/**
 * @brief Strictly increasing sequence of timestamps.
 */
class TimeAxis {
 public:
  TimeAxis() = default;

  /**
   * @brief Build an axis; fails when entries are not strictly increasing.
   */
  static std::optional<TimeAxis> FromTimestamps(std::vector<Timestamp> stamps);

  /**
   * @brief Parse every entry; fails on any unparseable or out-of-order entry.
   */
  static std::optional<TimeAxis> FromStrings(const std::vector<std::string>& stamps);

  [[nodiscard]] std::size_t size() const noexcept { return stamps_.size(); }
  [[nodiscard]] bool empty() const noexcept { return stamps_.empty(); }
  [[nodiscard]] const Timestamp& operator[](std::size_t i) const noexcept { return stamps_[i]; }
  [[nodiscard]] const std::vector<Timestamp>& stamps() const noexcept { return stamps_; }

  /**
   * @brief Exact position of `t`; no snapping to neighbouring entries.
   */
  [[nodiscard]] std::optional<std::size_t> find(const Timestamp& t) const noexcept;

  /**
   * @brief Parse `text` and return its exact position.
   * @return `InvalidInput` if unparseable, `NotFound` if absent from the axis.
   */
  [[nodiscard]] PositionResult position_of(std::string_view text) const;

  /**
   * @brief Positions whose calendar year is in `years`, ascending.
   */
  [[nodiscard]] std::vector<std::size_t> positions_in_years(const std::vector<int>& years) const;

  /**
   * @brief Distinct calendar years on the axis, ascending.
   */
  [[nodiscard]] std::vector<int> years() const;

  /**
   * @brief Entries of `other` appended; the result must remain strictly increasing.
   */
  [[nodiscard]] std::optional<TimeAxis> concat(const TimeAxis& other) const;

  friend bool operator==(const TimeAxis&, const TimeAxis&) = default;

 private:
  explicit TimeAxis(std::vector<Timestamp> stamps) : stamps_(std::move(stamps)) {}

  std::vector<Timestamp> stamps_{};
};

/**
 * @brief Year token embedded in a file name.
 *
 * A year is a standalone run of exactly four digits starting with `19` or `20`.
 */
[[nodiscard]] std::optional<int> parse_year(std::string_view name);

}  // namespace resx::core
