/**
 * @file types.hpp
 * @brief Core domain types for resx.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace resx::core {

/**
 * @brief Standard status code used by query and storage outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, NotFound, ShardInconsistency, DataUnavailable, Unsupported };

/**
 * @brief Which key failed to resolve when a result carries `Status::NotFound`.
 */
enum class Missing : std::uint8_t { None, Dataset, Site, Timestamp, Year, Variable };

/**
 * @brief Resource domain of a collection.
 */
enum class Domain : std::uint8_t { Generic, Solar, Nsrdb, Wind, Wave };

/**
 * @brief Storage layout backing a collection.
 */
enum class Layout : std::uint8_t { SingleFile, MultiFile, MultiYear };

/**
 * @brief Site identifier; equal to the row position in the site table.
 */
using SiteId = std::size_t;

/**
 * @brief Geographic coordinate in degrees.
 */
struct LatLon {
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief Selection over one axis of a dataset: everything, or an ordered index list.
 */
struct Selection {
  bool all{true};
  std::vector<std::size_t> indices{};

  static Selection All() { return Selection{}; }
  static Selection Of(std::vector<std::size_t> idx) { return Selection{.all = false, .indices = std::move(idx)}; }
  static Selection One(std::size_t i) { return Selection{.all = false, .indices = {i}}; }

  [[nodiscard]] std::size_t count(std::size_t axis_length) const noexcept { return all ? axis_length : indices.size(); }
  [[nodiscard]] std::size_t at(std::size_t k) const noexcept { return all ? k : indices[k]; }
};

[[nodiscard]] constexpr std::string_view to_string(Status s) noexcept {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid input";
    case Status::NotFound:
      return "not found";
    case Status::ShardInconsistency:
      return "shard inconsistency";
    case Status::DataUnavailable:
      return "data unavailable";
    case Status::Unsupported:
      return "unsupported";
  }
  return "unknown";
}

}  // namespace resx::core
