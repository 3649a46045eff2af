/**
 * @file query_surface.cpp
 * @brief Query surface implementation.
 * @author Watosn
 */

#include "resx/extraction/query_surface.hpp"

#include <numeric>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace resx::extraction {

using resx::core::Missing;
using resx::core::Selection;
using resx::core::SiteId;
using resx::core::Status;

SeriesValues QuerySurface::series_values(const std::string& dataset, const std::vector<SiteId>& site_ids) const {
  if (!store_.has_dataset(dataset)) {
    spdlog::debug("{}: no dataset named {}", store_.source_name(), dataset);
    return SeriesValues{.status = Status::NotFound, .missing = Missing::Dataset};
  }
  for (const SiteId id : site_ids) {
    if (!store_.meta().contains(id)) {
      spdlog::debug("{}: site {} out of range ({} sites)", store_.source_name(), id, store_.meta().size());
      return SeriesValues{.status = Status::NotFound, .missing = Missing::Site};
    }
  }
  if (site_ids.empty()) {
    return SeriesValues{.values = Eigen::MatrixXd(static_cast<Eigen::Index>(store_.time_index().size()), 0)};
  }

  auto slice = store_.read(dataset, Selection::All(), Selection::Of(site_ids));
  if (slice.status != Status::Ok) {
    return SeriesValues{.status = slice.status};
  }
  return SeriesValues{.values = std::move(slice.values)};
}

SeriesTable QuerySurface::series(const std::string& dataset, SiteId site_id) const {
  auto raw = series_values(dataset, {site_id});
  if (raw.status != Status::Ok) {
    return SeriesTable{.status = raw.status, .missing = raw.missing};
  }
  return SeriesTable{.name = fmt::format("{}", site_id),
                     .columns = {dataset},
                     .site_ids = {site_id},
                     .time_index = store_.time_index().stamps(),
                     .values = std::move(raw.values)};
}

SeriesTable QuerySurface::series(const std::string& dataset, const std::vector<SiteId>& site_ids) const {
  auto raw = series_values(dataset, site_ids);
  if (raw.status != Status::Ok) {
    return SeriesTable{.status = raw.status, .missing = raw.missing};
  }
  SeriesTable out{.name = dataset,
                  .site_ids = site_ids,
                  .time_index = store_.time_index().stamps(),
                  .values = std::move(raw.values)};
  out.columns.reserve(site_ids.size());
  for (const SiteId id : site_ids) {
    out.columns.push_back(fmt::format("{}", id));
  }
  return out;
}

SeriesTable QuerySurface::lat_lon_series(const std::string& dataset, const resx::core::LatLon& coord) const {
  const auto site = locator_.nearest_site(coord);
  if (site.status != Status::Ok) {
    return SeriesTable{.status = site.status};
  }
  return series(dataset, site.site_id);
}

SeriesTable QuerySurface::lat_lon_series(const std::string& dataset,
                                         const std::vector<resx::core::LatLon>& coords) const {
  const auto sites = locator_.nearest_sites(coords);
  if (sites.status != Status::Ok) {
    return SeriesTable{.status = sites.status};
  }
  return series(dataset, sites.site_ids);
}

SeriesTable QuerySurface::region_series(const std::string& dataset, const std::string& region,
                                        const std::string& column) const {
  return series(dataset, locator_.sites_in_region(region, column));
}

SpatialMap QuerySurface::snapshot(const std::string& dataset, std::string_view timestamp,
                                  const std::optional<std::string>& region, const std::string& column) const {
  const auto pos = store_.time_index().position_of(timestamp);
  if (pos.status != Status::Ok) {
    return SpatialMap{.dataset = dataset,
                      .status = pos.status,
                      .missing = pos.status == Status::NotFound ? Missing::Timestamp : Missing::None};
  }
  return spatial_map(dataset, Selection::One(pos.position), region, column, false);
}

SpatialMap QuerySurface::mean_map(const std::string& dataset, const std::vector<int>& years,
                                  const std::optional<std::string>& region, const std::string& column) const {
  if (years.empty()) {
    return SpatialMap{.dataset = dataset, .status = Status::InvalidInput};
  }
  const auto& axis = store_.time_index();
  for (const int y : years) {
    if (axis.positions_in_years({y}).empty()) {
      spdlog::debug("{}: no time steps in year {}", store_.source_name(), y);
      return SpatialMap{.dataset = dataset, .status = Status::NotFound, .missing = Missing::Year};
    }
  }
  return mean_map_at(dataset, axis.positions_in_years(years), region, column);
}

SpatialMap QuerySurface::mean_map_at(const std::string& dataset, const std::vector<std::size_t>& positions,
                                     const std::optional<std::string>& region, const std::string& column) const {
  if (positions.empty()) {
    return SpatialMap{.dataset = dataset, .status = Status::NotFound, .missing = Missing::Year};
  }
  return spatial_map(dataset, Selection::Of(positions), region, column, true);
}

SpatialMap QuerySurface::spatial_map(const std::string& dataset, const Selection& time,
                                     const std::optional<std::string>& region, const std::string& column,
                                     bool average) const {
  if (!store_.has_dataset(dataset)) {
    return SpatialMap{.dataset = dataset, .status = Status::NotFound, .missing = Missing::Dataset};
  }
  const auto& coords = locator_.lat_lon();
  if (!coords.has_value()) {
    return SpatialMap{.dataset = dataset, .status = Status::DataUnavailable};
  }

  std::vector<SiteId> ids;
  if (region.has_value()) {
    ids = locator_.sites_in_region(*region, column);
    if (ids.empty()) {
      return SpatialMap{.dataset = dataset};
    }
  } else {
    ids.resize(store_.meta().size());
    std::iota(ids.begin(), ids.end(), SiteId{0});
  }

  const auto slice = store_.read(dataset, time, region.has_value() ? Selection::Of(ids) : Selection::All());
  if (slice.status != Status::Ok) {
    return SpatialMap{.dataset = dataset, .status = slice.status};
  }

  const auto n = static_cast<Eigen::Index>(ids.size());
  SpatialMap out{.dataset = dataset, .site_ids = ids};
  out.longitude.resize(n);
  out.latitude.resize(n);
  out.values = average ? Eigen::VectorXd(slice.values.colwise().mean().transpose())
                       : Eigen::VectorXd(slice.values.row(0).transpose());
  for (Eigen::Index k = 0; k < n; ++k) {
    const auto site = static_cast<Eigen::Index>(ids[static_cast<std::size_t>(k)]);
    out.latitude(k) = (*coords)(site, 0);
    out.longitude(k) = (*coords)(site, 1);
  }
  return out;
}

}  // namespace resx::extraction
