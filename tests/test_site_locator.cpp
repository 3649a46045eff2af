/**
 * @file test_site_locator.cpp
 * @brief Coordinate and region resolution over a small site table.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "resx/spatial/site_locator.hpp"
#include "resx/spatial/tree_cache.hpp"
#include "resx/storage/memory_store.hpp"

namespace {

std::unique_ptr<resx::storage::MemoryResourceStore> make_store(bool with_coordinates_field) {
  using resx::core::Column;
  using resx::core::ColumnKind;
  auto meta = resx::core::SiteTable::FromColumns({
      Column{.name = "latitude", .kind = ColumnKind::Numeric, .numbers = {40.0, 41.0, 39.5}},
      Column{.name = "longitude", .kind = ColumnKind::Numeric, .numbers = {-105.0, -104.0, -104.8}},
      Column{.name = "state", .kind = ColumnKind::Text, .strings = {"CO", "WY", "CO"}},
      Column{.name = "country", .kind = ColumnKind::Text, .strings = {"United States", "United States", "United States"}},
  });
  auto axis = resx::core::TimeAxis::FromStrings({"2012-01-01T00:00", "2012-01-01T01:00"});
  if (!meta.has_value() || !axis.has_value()) {
    return {};
  }
  std::optional<Eigen::MatrixX2d> coords;
  if (with_coordinates_field) {
    Eigen::MatrixX2d c(3, 2);
    c << 40.0, -105.0, 41.0, -104.0, 39.5, -104.8;
    coords = c;
  }
  return resx::storage::MemoryResourceStore::Create({.source_name = "sites_2012.h5",
                                                     .meta = std::move(*meta),
                                                     .time_index = std::move(*axis),
                                                     .coordinates = coords});
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using resx::core::LatLon;
  using resx::core::Status;
  using resx::spatial::SiteLocator;

  const auto store = make_store(false);
  if (!store) {
    spdlog::error("store setup failed");
    return 1;
  }
  auto cache = resx::spatial::DirectoryTreeCache::Create();
  if (!cache) {
    spdlog::error("cache setup failed");
    return 2;
  }
  const SiteLocator locator(*store, {.tree_cache = cache.get()});

  const auto lat_lon = locator.lat_lon();
  if (!lat_lon.has_value() || lat_lon->rows() != 3 || (*lat_lon)(1, 0) != 41.0 || (*lat_lon)(1, 1) != -104.0) {
    spdlog::error("lat/lon columns not discovered");
    return 3;
  }

  const auto near = locator.nearest_site(LatLon{.lat_deg = 40.1, .lon_deg = -105.0});
  if (near.status != Status::Ok || near.site_id != 0) {
    spdlog::error("nearest site expected 0, got {}", near.site_id);
    return 4;
  }
  if (locator.index() == nullptr || locator.index()->origin() != resx::spatial::IndexOrigin::Built ||
      !fs::exists(cache->path_for(locator.cache_key()))) {
    spdlog::error("index was not built and cached");
    return 5;
  }

  const auto many = locator.nearest_sites({LatLon{.lat_deg = 41.2, .lon_deg = -103.9},
                                           LatLon{.lat_deg = 39.4, .lon_deg = -104.7},
                                           LatLon{.lat_deg = 40.0, .lon_deg = -105.0}});
  if (many.status != Status::Ok || many.site_ids != std::vector<resx::core::SiteId>{1, 2, 0}) {
    spdlog::error("batch nearest sites failed");
    return 6;
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  if (locator.nearest_site(LatLon{.lat_deg = nan, .lon_deg = -105.0}).status != Status::InvalidInput ||
      locator.nearest_sites({LatLon{.lat_deg = 40.0, .lon_deg = INFINITY}}).status != Status::InvalidInput) {
    spdlog::error("non-finite coordinates accepted");
    return 7;
  }

  if (locator.sites_in_region("CO") != std::vector<resx::core::SiteId>{0, 2} ||
      !locator.sites_in_region("CA").empty() || !locator.sites_in_region("CO", "county").empty() ||
      locator.sites_in_region("WY", "state") != std::vector<resx::core::SiteId>{1}) {
    spdlog::error("region resolution failed");
    return 8;
  }

  const auto states = locator.states();
  if (!states.has_value() || *states != std::vector<std::string>{"CO", "WY"} || locator.counties().has_value() ||
      !locator.countries().has_value() || locator.countries()->size() != 1) {
    spdlog::error("region discovery failed");
    return 9;
  }

  // A second locator over the same source reuses the cached index.
  const SiteLocator again(*store, {.tree_cache = cache.get()});
  if (again.nearest_site(LatLon{.lat_deg = 40.1, .lon_deg = -105.0}).site_id != 0 ||
      again.index()->origin() != resx::spatial::IndexOrigin::LoadedFromCache) {
    spdlog::error("cached index not reused");
    return 10;
  }

  // Supplied tree wins over the cache; a mismatching one is ignored.
  const SiteLocator supplied(*store, {.tree = locator.index()->tree()});
  if (supplied.index()->origin() != resx::spatial::IndexOrigin::Supplied) {
    spdlog::error("supplied tree not adopted");
    return 11;
  }
  Eigen::MatrixX2d other(2, 2);
  other << 0.0, 0.0, 1.0, 1.0;
  const SiteLocator mismatched(*store, {.tree = resx::spatial::KdTree::Build(other)});
  if (mismatched.index()->origin() != resx::spatial::IndexOrigin::Built ||
      mismatched.nearest_site(LatLon{.lat_deg = 41.0, .lon_deg = -104.0}).site_id != 1) {
    spdlog::error("mismatching supplied tree was used");
    return 12;
  }

  const auto tree_file = cache->directory() / "supplied.kdt";
  {
    std::ofstream out(tree_file, std::ios::binary | std::ios::trunc);
    out << locator.index()->tree().serialize();
  }
  const SiteLocator from_file(*store, {.tree_file = tree_file});
  if (from_file.index()->origin() != resx::spatial::IndexOrigin::Supplied) {
    spdlog::error("tree file not used");
    return 13;
  }
  const SiteLocator bad_file(*store, {.tree_file = cache->directory() / "absent.kdt"});
  if (bad_file.index()->origin() != resx::spatial::IndexOrigin::Built) {
    spdlog::error("missing tree file did not fall back to a build");
    return 14;
  }

  // A direct coordinates field takes precedence over lat/lon columns.
  const auto with_field = make_store(true);
  const SiteLocator direct(*with_field, {});
  if (!direct.lat_lon().has_value() || direct.nearest_site(LatLon{.lat_deg = 39.6, .lon_deg = -104.8}).site_id != 2) {
    spdlog::error("coordinates field not used");
    return 15;
  }

  auto bare = resx::storage::MemoryResourceStore::Create(
      {.source_name = "bare.h5",
       .meta = *resx::core::SiteTable::FromColumns(
           {resx::core::Column{.name = "state", .kind = resx::core::ColumnKind::Text, .strings = {"CO"}}})});
  const SiteLocator no_coords(*bare, {});
  if (no_coords.nearest_site(LatLon{.lat_deg = 40.0, .lon_deg = -105.0}).status != Status::DataUnavailable) {
    spdlog::error("missing coordinates not reported");
    return 16;
  }

  return 0;
}
