/**
 * @file site_locator.cpp
 * @brief Site locator implementation.
 * @author Watosn
 */

#include "resx/spatial/site_locator.hpp"

#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

namespace resx::spatial {
namespace {

bool finite(const resx::core::LatLon& c) { return std::isfinite(c.lat_deg) && std::isfinite(c.lon_deg); }

}  // namespace

SiteLocator::SiteLocator(const resx::core::IResourceStore& store, Config config)
    : store_(store), config_(std::move(config)) {}

const std::optional<Eigen::MatrixX2d>& SiteLocator::lat_lon() const {
  if (!lat_lon_ready_) {
    lat_lon_ = store_.coordinates();
    if (!lat_lon_.has_value()) {
      lat_lon_ = store_.meta().lat_lon();
    }
    lat_lon_ready_ = true;
  }
  return lat_lon_;
}

const CoordinateIndex* SiteLocator::index() const {
  if (index_.has_value()) {
    return &*index_;
  }
  const auto& coords = lat_lon();
  if (!coords.has_value()) {
    spdlog::error("{}: no coordinates field or lat/lon columns to index", store_.source_name());
    return nullptr;
  }

  if (config_.tree.has_value()) {
    index_ = CoordinateIndex::Adopt(*config_.tree, *coords);
    if (index_.has_value()) {
      return &*index_;
    }
    spdlog::warn("{}: supplied tree does not index this collection; ignoring it", store_.source_name());
  }
  if (!config_.tree_file.empty()) {
    auto loaded = load_tree_file(config_.tree_file);
    if (loaded.has_value()) {
      index_ = CoordinateIndex::Adopt(std::move(*loaded), *coords);
      if (index_.has_value()) {
        return &*index_;
      }
      spdlog::warn("{}: tree file {} does not index this collection; ignoring it", store_.source_name(),
                   config_.tree_file.string());
    }
  }

  index_ = CoordinateIndex::GetOrBuild(*coords, cache_key(), config_.tree_cache);
  return &*index_;
}

NearestSite SiteLocator::nearest_site(const resx::core::LatLon& coord) const {
  if (!finite(coord)) {
    return NearestSite{.status = resx::core::Status::InvalidInput};
  }
  const CoordinateIndex* idx = index();
  if (idx == nullptr) {
    return NearestSite{.status = resx::core::Status::DataUnavailable};
  }
  const auto id = idx->nearest(coord);
  if (!id.has_value()) {
    return NearestSite{.status = resx::core::Status::NotFound};
  }
  return NearestSite{.site_id = *id};
}

NearestSites SiteLocator::nearest_sites(const std::vector<resx::core::LatLon>& coords) const {
  for (const auto& c : coords) {
    if (!finite(c)) {
      return NearestSites{.status = resx::core::Status::InvalidInput};
    }
  }
  const CoordinateIndex* idx = index();
  if (idx == nullptr) {
    return NearestSites{.status = resx::core::Status::DataUnavailable};
  }
  auto ids = idx->nearest(coords);
  if (ids.size() != coords.size()) {
    return NearestSites{.status = resx::core::Status::NotFound};
  }
  return NearestSites{.site_ids = std::move(ids)};
}

std::vector<resx::core::SiteId> SiteLocator::sites_in_region(const std::string& value, const std::string& column) const {
  return store_.meta().ids_where(column, value);
}

std::optional<std::vector<std::string>> SiteLocator::available_regions(const std::string& column) const {
  return store_.meta().distinct(column);
}

}  // namespace resx::spatial
