/**
 * @file query_surface.hpp
 * @brief Dataset queries by site, region, coordinate and time over any store.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"
#include "resx/core/types.hpp"
#include "resx/spatial/site_locator.hpp"

namespace resx::extraction {

/**
 * @brief Raw (time x sites) values of one dataset.
 */
struct SeriesValues {
  Eigen::MatrixXd values{};
  resx::core::Status status{resx::core::Status::Ok};
  resx::core::Missing missing{resx::core::Missing::None};
};

/**
 * @brief Labelled time series: one column per site, one row per time-axis entry.
 *
 * A single-site table is named after the site id and has one column named
 * after the dataset; a multi-site table is named after the dataset and has one
 * column per site id.
 */
struct SeriesTable {
  std::string name{};
  std::vector<std::string> columns{};
  std::vector<resx::core::SiteId> site_ids{};
  std::vector<resx::core::Timestamp> time_index{};
  Eigen::MatrixXd values{};
  resx::core::Status status{resx::core::Status::Ok};
  resx::core::Missing missing{resx::core::Missing::None};
};

/**
 * @brief One value per site with the site's coordinates.
 */
struct SpatialMap {
  std::string dataset{};
  std::vector<resx::core::SiteId> site_ids{};
  Eigen::VectorXd longitude{};
  Eigen::VectorXd latitude{};
  Eigen::VectorXd values{};
  resx::core::Status status{resx::core::Status::Ok};
  resx::core::Missing missing{resx::core::Missing::None};

  [[nodiscard]] std::size_t size() const noexcept { return site_ids.size(); }
};

/**
 * @brief Query surface bound to one store and its site locator.
 *
 * Holds references only; the store and locator must outlive it.
 */
class QuerySurface {
 public:
  QuerySurface(const resx::core::IResourceStore& store, const resx::spatial::SiteLocator& locator)
      : store_(store), locator_(locator) {}

  /**
   * @brief Full time range of `dataset` for the given sites, unlabelled.
   * @return `NotFound` with `missing` set to `Dataset` or `Site` when a key does not resolve.
   */
  [[nodiscard]] SeriesValues series_values(const std::string& dataset,
                                           const std::vector<resx::core::SiteId>& site_ids) const;

  [[nodiscard]] SeriesTable series(const std::string& dataset, resx::core::SiteId site_id) const;
  [[nodiscard]] SeriesTable series(const std::string& dataset, const std::vector<resx::core::SiteId>& site_ids) const;

  /**
   * @brief Series of the site nearest to a coordinate.
   */
  [[nodiscard]] SeriesTable lat_lon_series(const std::string& dataset, const resx::core::LatLon& coord) const;
  [[nodiscard]] SeriesTable lat_lon_series(const std::string& dataset,
                                           const std::vector<resx::core::LatLon>& coords) const;

  /**
   * @brief Series of every site whose `column` equals `region`; empty when nothing matches.
   */
  [[nodiscard]] SeriesTable region_series(const std::string& dataset, const std::string& region,
                                          const std::string& column = "state") const;

  /**
   * @brief Values of every site (or of one region) at one time-axis entry.
   * @param timestamp Any parseable calendar timestamp; must match an axis entry exactly.
   */
  [[nodiscard]] SpatialMap snapshot(const std::string& dataset, std::string_view timestamp,
                                    const std::optional<std::string>& region = std::nullopt,
                                    const std::string& column = "state") const;

  /**
   * @brief Per-site mean over the time-axis entries whose UTC calendar year is in `years`.
   * @return `NotFound` with `missing == Year` when a year has no entries on the axis.
   */
  [[nodiscard]] SpatialMap mean_map(const std::string& dataset, const std::vector<int>& years,
                                    const std::optional<std::string>& region = std::nullopt,
                                    const std::string& column = "state") const;

  /**
   * @brief Per-site mean over explicit time-axis positions.
   * @return `NotFound` with `missing == Year` when `positions` is empty.
   */
  [[nodiscard]] SpatialMap mean_map_at(const std::string& dataset, const std::vector<std::size_t>& positions,
                                       const std::optional<std::string>& region = std::nullopt,
                                       const std::string& column = "state") const;

 private:
  [[nodiscard]] SpatialMap spatial_map(const std::string& dataset, const resx::core::Selection& time,
                                       const std::optional<std::string>& region, const std::string& column,
                                       bool average) const;

  const resx::core::IResourceStore& store_;
  const resx::spatial::SiteLocator& locator_;
};

}  // namespace resx::extraction
