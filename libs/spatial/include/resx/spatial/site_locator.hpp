/**
 * @file site_locator.hpp
 * @brief Coordinate-to-site and region-to-sites resolution for one store.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"
#include "resx/core/types.hpp"
#include "resx/spatial/coordinate_index.hpp"

namespace resx::spatial {

/**
 * @brief Nearest-site lookup output for one coordinate.
 */
struct NearestSite {
  resx::core::SiteId site_id{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief Nearest-site lookup output for a coordinate sequence, in input order.
 */
struct NearestSites {
  std::vector<resx::core::SiteId> site_ids{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief Resolves user-facing keys (coordinates, region names) to site ids.
 *
 * The coordinate index is built on first spatial query and memoized for the
 * locator's lifetime. The store's site table must not change after that point.
 */
class SiteLocator {
 public:
  /**
   * @brief Locator configuration.
   */
  struct Config {
    resx::core::ITreeCache* tree_cache{nullptr};
    std::optional<KdTree> tree{};
    std::filesystem::path tree_file{};
  };

  SiteLocator(const resx::core::IResourceStore& store, Config config);

  /**
   * @brief Site nearest to one (lat, lon) pair.
   * @return `InvalidInput` for non-finite input, `DataUnavailable` when the store has no coordinates.
   */
  [[nodiscard]] NearestSite nearest_site(const resx::core::LatLon& coord) const;

  /**
   * @brief Sites nearest to each pair of an ordered sequence.
   */
  [[nodiscard]] NearestSites nearest_sites(const std::vector<resx::core::LatLon>& coords) const;

  /**
   * @brief Ids whose `column` equals `value`, ascending; empty when nothing matches.
   */
  [[nodiscard]] std::vector<resx::core::SiteId> sites_in_region(const std::string& value,
                                                                const std::string& column = "state") const;

  /**
   * @brief Distinct values of `column`, or nullopt when the column does not exist.
   */
  [[nodiscard]] std::optional<std::vector<std::string>> available_regions(const std::string& column) const;

  [[nodiscard]] std::optional<std::vector<std::string>> countries() const { return available_regions("country"); }
  [[nodiscard]] std::optional<std::vector<std::string>> states() const { return available_regions("state"); }
  [[nodiscard]] std::optional<std::vector<std::string>> counties() const { return available_regions("county"); }

  /**
   * @brief (lat, lon) table: the store's coordinates field, else the first columns named lat... and lon...
   */
  [[nodiscard]] const std::optional<Eigen::MatrixX2d>& lat_lon() const;

  /**
   * @brief Memoized coordinate index, or null when the store has no coordinates.
   */
  [[nodiscard]] const CoordinateIndex* index() const;

  [[nodiscard]] std::string cache_key() const { return cache_key_for(store_.source_name()); }

 private:
  const resx::core::IResourceStore& store_;
  Config config_{};
  mutable bool lat_lon_ready_{false};
  mutable std::optional<Eigen::MatrixX2d> lat_lon_{};
  mutable std::optional<CoordinateIndex> index_{};
};

}  // namespace resx::spatial
