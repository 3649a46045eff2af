/**
 * @file resource_collection.hpp
 * @brief Collection composer: binds a storage layout and a domain to the query surface.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"
#include "resx/core/types.hpp"
#include "resx/extraction/bundle_exporter.hpp"
#include "resx/extraction/query_surface.hpp"
#include "resx/extraction/variable_sets.hpp"
#include "resx/spatial/coordinate_index.hpp"
#include "resx/spatial/kd_tree.hpp"
#include "resx/spatial/site_locator.hpp"
#include "resx/storage/multi_year_store.hpp"

namespace resx::extraction {

class ResourceCollection;

/**
 * @brief Output of composing a collection.
 */
struct Composition {
  std::unique_ptr<ResourceCollection> collection{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief One logical collection over a single file, spatial shards or yearly shards.
 *
 * Site lookups, queries and bundles behave identically for every layout. The
 * coordinate index is built on the first spatial query and kept until the
 * collection is destroyed, which also releases every storage handle.
 */
class ResourceCollection {
 public:
  /**
   * @brief Layout-independent options.
   */
  struct Options {
    resx::core::Domain domain{resx::core::Domain::Generic};
    std::shared_ptr<resx::core::ITreeCache> tree_cache{};  ///< null disables index persistence
    std::optional<resx::spatial::KdTree> tree{};           ///< pre-computed index
    std::filesystem::path tree_file{};                     ///< serialized pre-computed index
  };

  /**
   * @brief File-backed collection configuration.
   */
  struct Config {
    resx::core::Layout layout{resx::core::Layout::SingleFile};
    /// File (single), or directory / `dir/prefix*suffix` pattern (multi-file, multi-year).
    std::filesystem::path resource_path{};
    std::vector<int> years{};  ///< multi-year only; empty keeps every year found
    bool unscale{true};
    Options options{};
  };

  /**
   * @brief Discover and open HDF5 resource files, then compose them.
   * @return `InvalidInput` for a missing path, `NotFound` when no file matches,
   * `DataUnavailable` when a file cannot be opened, `ShardInconsistency` when shards disagree.
   */
  static Composition Compose(const Config& config);

  static Composition FromStore(std::unique_ptr<resx::core::IResourceStore> store, Options options);
  static Composition FromShards(std::vector<std::unique_ptr<resx::core::IResourceStore>> shards, Options options);
  static Composition FromYears(std::vector<resx::storage::YearShard> shards, Options options);

  static Composition FromStore(std::unique_ptr<resx::core::IResourceStore> store) {
    return FromStore(std::move(store), Options{});
  }
  static Composition FromShards(std::vector<std::unique_ptr<resx::core::IResourceStore>> shards) {
    return FromShards(std::move(shards), Options{});
  }
  static Composition FromYears(std::vector<resx::storage::YearShard> shards) {
    return FromYears(std::move(shards), Options{});
  }

  ResourceCollection(const ResourceCollection&) = delete;
  ResourceCollection& operator=(const ResourceCollection&) = delete;

  [[nodiscard]] resx::core::Domain domain() const noexcept { return options_.domain; }
  [[nodiscard]] resx::core::Layout layout() const noexcept { return layout_; }
  [[nodiscard]] const resx::core::IResourceStore& store() const noexcept { return *store_; }
  [[nodiscard]] const resx::core::SiteTable& meta() const { return store_->meta(); }
  [[nodiscard]] const resx::core::TimeAxis& time_index() const { return store_->time_index(); }
  [[nodiscard]] std::vector<std::string> datasets() const { return store_->datasets(); }
  [[nodiscard]] const std::optional<Eigen::MatrixX2d>& lat_lon() const { return locator_.lat_lon(); }
  [[nodiscard]] const resx::spatial::CoordinateIndex* index() const { return locator_.index(); }

  /**
   * @brief Years covered: the shard years for multi-year collections, else the years on the time axis.
   */
  [[nodiscard]] std::vector<int> years() const;

  [[nodiscard]] resx::core::PositionResult position_of(std::string_view timestamp) const {
    return store_->time_index().position_of(timestamp);
  }

  [[nodiscard]] resx::spatial::NearestSite nearest_site(const resx::core::LatLon& coord) const {
    return locator_.nearest_site(coord);
  }
  [[nodiscard]] resx::spatial::NearestSites nearest_sites(const std::vector<resx::core::LatLon>& coords) const {
    return locator_.nearest_sites(coords);
  }
  [[nodiscard]] std::vector<resx::core::SiteId> sites_in_region(const std::string& value,
                                                                const std::string& column = "state") const {
    return locator_.sites_in_region(value, column);
  }
  [[nodiscard]] std::optional<std::vector<std::string>> available_regions(const std::string& column) const {
    return locator_.available_regions(column);
  }
  [[nodiscard]] std::optional<std::vector<std::string>> countries() const { return locator_.countries(); }
  [[nodiscard]] std::optional<std::vector<std::string>> states() const { return locator_.states(); }
  [[nodiscard]] std::optional<std::vector<std::string>> counties() const { return locator_.counties(); }

  [[nodiscard]] const QuerySurface& query() const noexcept { return query_; }
  [[nodiscard]] const BundleExporter& exporter() const noexcept { return exporter_; }

  /**
   * @brief Per-site mean over `years`.
   * @return `Unsupported` unless the collection is multi-year.
   */
  [[nodiscard]] SpatialMap mean_map(const std::string& dataset, const std::vector<int>& years,
                                    const std::optional<std::string>& region = std::nullopt,
                                    const std::string& column = "state") const;

  /**
   * @brief The domain's default bundle variables.
   */
  [[nodiscard]] VariableSet bundle_variables() const { return default_variables(options_.domain); }

  /**
   * @brief Bundles of the domain's default variables, optionally exported to `destination`.
   */
  [[nodiscard]] BundleBatch bundle(const std::vector<resx::core::SiteId>& site_ids,
                                   const std::optional<std::filesystem::path>& destination = std::nullopt) const;

  [[nodiscard]] BundleBatch bundle(const std::vector<resx::core::SiteId>& site_ids, const VariableSet& variables,
                                   const std::optional<std::filesystem::path>& destination = std::nullopt) const;

  /**
   * @brief Bundle of the site nearest to `coord`.
   */
  [[nodiscard]] BundleBatch bundle_at(const resx::core::LatLon& coord,
                                      const std::optional<std::filesystem::path>& destination = std::nullopt) const;

  /**
   * @brief Bundles of the sites nearest to each coordinate, in input order.
   *
   * A single coordinate yields a single bundle, several yield a sequence.
   */
  [[nodiscard]] BundleBatch bundle_at(const std::vector<resx::core::LatLon>& coords,
                                      const std::optional<std::filesystem::path>& destination = std::nullopt) const;

  /**
   * @brief Wind bundles at one hub height.
   * @return `Unsupported` for collections outside the wind domain.
   */
  [[nodiscard]] BundleBatch bundle_at_hub_height(int hub_height_m, const std::vector<resx::core::SiteId>& site_ids,
                                                 const std::optional<std::filesystem::path>& destination =
                                                     std::nullopt) const;

  [[nodiscard]] BundleBatch bundle_at_hub_height(int hub_height_m, const resx::core::LatLon& coord,
                                                 const std::optional<std::filesystem::path>& destination =
                                                     std::nullopt) const;

  [[nodiscard]] BundleBatch bundle_at_hub_height(int hub_height_m, const std::vector<resx::core::LatLon>& coords,
                                                 const std::optional<std::filesystem::path>& destination =
                                                     std::nullopt) const;

 private:
  ResourceCollection(resx::core::Layout layout, std::unique_ptr<resx::core::IResourceStore> store,
                     const resx::storage::MultiYearResourceStore* yearly, Options options);

  resx::core::Layout layout_{resx::core::Layout::SingleFile};
  Options options_{};
  std::unique_ptr<resx::core::IResourceStore> store_{};
  const resx::storage::MultiYearResourceStore* yearly_{nullptr};
  resx::spatial::SiteLocator locator_;
  QuerySurface query_;
  BundleExporter exporter_;
};

}  // namespace resx::extraction
