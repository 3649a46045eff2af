/**
 * @file resource_collection.cpp
 * @brief Collection composition over single-file, multi-file and multi-year layouts.
 * @author Watosn
 */

#include "resx/extraction/resource_collection.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "resx/storage/discovery.hpp"
#include "resx/storage/h5_store.hpp"
#include "resx/storage/multi_file_store.hpp"

namespace resx::extraction {
namespace {

using resx::core::Layout;
using resx::core::Status;

std::unique_ptr<resx::storage::H5ResourceStore> open_file(const std::filesystem::path& file, bool unscale) {
  return resx::storage::H5ResourceStore::Open(resx::storage::H5ResourceStore::Config{.file = file, .unscale = unscale});
}

Composition compose_single(const ResourceCollection::Config& config) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(config.resource_path, ec)) {
    spdlog::error("resource file not found: {}", config.resource_path.string());
    return Composition{.status = Status::InvalidInput};
  }
  auto store = open_file(config.resource_path, config.unscale);
  if (!store) {
    return Composition{.status = Status::DataUnavailable};
  }
  return ResourceCollection::FromStore(std::move(store), config.options);
}

Composition compose_shards(const ResourceCollection::Config& config) {
  const auto found = resx::storage::discover_shards(config.resource_path);
  if (found.status != Status::Ok) {
    return Composition{.status = found.status};
  }
  std::vector<std::unique_ptr<resx::core::IResourceStore>> shards;
  shards.reserve(found.files.size());
  for (const auto& file : found.files) {
    auto store = open_file(file, config.unscale);
    if (!store) {
      return Composition{.status = Status::DataUnavailable};
    }
    shards.push_back(std::move(store));
  }
  return ResourceCollection::FromShards(std::move(shards), config.options);
}

Composition compose_years(const ResourceCollection::Config& config) {
  const auto found = resx::storage::discover_years(config.resource_path, config.years);
  if (found.status != Status::Ok) {
    return Composition{.status = found.status};
  }
  std::vector<resx::storage::YearShard> shards;
  shards.reserve(found.files.size());
  for (const auto& entry : found.files) {
    auto store = open_file(entry.file, config.unscale);
    if (!store) {
      return Composition{.status = Status::DataUnavailable};
    }
    shards.push_back(resx::storage::YearShard{.year = entry.year, .store = std::move(store)});
  }
  return ResourceCollection::FromYears(std::move(shards), config.options);
}

}  // namespace

ResourceCollection::ResourceCollection(Layout layout, std::unique_ptr<resx::core::IResourceStore> store,
                                       const resx::storage::MultiYearResourceStore* yearly, Options options)
    : layout_(layout),
      options_(std::move(options)),
      store_(std::move(store)),
      yearly_(yearly),
      locator_(*store_, resx::spatial::SiteLocator::Config{.tree_cache = options_.tree_cache.get(),
                                                           .tree = std::exchange(options_.tree, std::nullopt),
                                                           .tree_file = options_.tree_file}),
      query_(*store_, locator_),
      exporter_(*store_) {}

Composition ResourceCollection::Compose(const Config& config) {
  switch (config.layout) {
    case Layout::SingleFile:
      return compose_single(config);
    case Layout::MultiFile:
      return compose_shards(config);
    case Layout::MultiYear:
      return compose_years(config);
  }
  return Composition{.status = Status::InvalidInput};
}

Composition ResourceCollection::FromStore(std::unique_ptr<resx::core::IResourceStore> store, Options options) {
  if (!store) {
    return Composition{.status = Status::InvalidInput};
  }
  return Composition{.collection = std::unique_ptr<ResourceCollection>(
                         new ResourceCollection(Layout::SingleFile, std::move(store), nullptr, std::move(options)))};
}

Composition ResourceCollection::FromShards(std::vector<std::unique_ptr<resx::core::IResourceStore>> shards,
                                           Options options) {
  auto composed = resx::storage::MultiFileResourceStore::Compose(std::move(shards));
  if (composed.status != Status::Ok) {
    return Composition{.status = composed.status};
  }
  return Composition{.collection = std::unique_ptr<ResourceCollection>(new ResourceCollection(
                         Layout::MultiFile, std::move(composed.store), nullptr, std::move(options)))};
}

Composition ResourceCollection::FromYears(std::vector<resx::storage::YearShard> shards, Options options) {
  auto composed = resx::storage::MultiYearResourceStore::Compose(std::move(shards));
  if (composed.status != Status::Ok) {
    return Composition{.status = composed.status};
  }
  const auto* yearly = composed.store.get();
  return Composition{.collection = std::unique_ptr<ResourceCollection>(
                         new ResourceCollection(Layout::MultiYear, std::move(composed.store), yearly,
                                                std::move(options)))};
}

std::vector<int> ResourceCollection::years() const {
  return yearly_ != nullptr ? yearly_->years() : store_->time_index().years();
}

SpatialMap ResourceCollection::mean_map(const std::string& dataset, const std::vector<int>& years,
                                        const std::optional<std::string>& region, const std::string& column) const {
  if (layout_ != Layout::MultiYear) {
    spdlog::error("{}: mean maps need a multi-year collection", store_->source_name());
    return SpatialMap{.dataset = dataset, .status = Status::Unsupported};
  }
  if (years.empty()) {
    return SpatialMap{.dataset = dataset, .status = Status::InvalidInput};
  }
  // Rows belong to the shard they were read from, whatever their UTC calendar year.
  const auto positions = yearly_->positions_for(years);
  if (!positions.has_value()) {
    spdlog::debug("{}: no yearly shard for one of the requested years", store_->source_name());
    return SpatialMap{.dataset = dataset, .status = Status::NotFound, .missing = resx::core::Missing::Year};
  }
  return query_.mean_map_at(dataset, *positions, region, column);
}

BundleBatch ResourceCollection::bundle(const std::vector<resx::core::SiteId>& site_ids,
                                       const std::optional<std::filesystem::path>& destination) const {
  return exporter_.build_bundles(site_ids, bundle_variables(), destination);
}

BundleBatch ResourceCollection::bundle(const std::vector<resx::core::SiteId>& site_ids, const VariableSet& variables,
                                       const std::optional<std::filesystem::path>& destination) const {
  return exporter_.build_bundles(site_ids, variables, destination);
}

BundleBatch ResourceCollection::bundle_at(const resx::core::LatLon& coord,
                                          const std::optional<std::filesystem::path>& destination) const {
  const auto site = locator_.nearest_site(coord);
  if (site.status != Status::Ok) {
    return BundleBatch{.status = site.status};
  }
  return bundle({site.site_id}, destination);
}

BundleBatch ResourceCollection::bundle_at(const std::vector<resx::core::LatLon>& coords,
                                          const std::optional<std::filesystem::path>& destination) const {
  const auto sites = locator_.nearest_sites(coords);
  if (sites.status != Status::Ok) {
    return BundleBatch{.status = sites.status};
  }
  return bundle(sites.site_ids, destination);
}

BundleBatch ResourceCollection::bundle_at_hub_height(int hub_height_m, const std::vector<resx::core::SiteId>& site_ids,
                                                     const std::optional<std::filesystem::path>& destination) const {
  if (options_.domain != resx::core::Domain::Wind) {
    return BundleBatch{.status = Status::Unsupported};
  }
  if (hub_height_m <= 0) {
    return BundleBatch{.status = Status::InvalidInput};
  }
  return exporter_.build_bundles(site_ids, wind_variables(hub_height_m), destination);
}

BundleBatch ResourceCollection::bundle_at_hub_height(int hub_height_m, const resx::core::LatLon& coord,
                                                     const std::optional<std::filesystem::path>& destination) const {
  if (options_.domain != resx::core::Domain::Wind) {
    return BundleBatch{.status = Status::Unsupported};
  }
  const auto site = locator_.nearest_site(coord);
  if (site.status != Status::Ok) {
    return BundleBatch{.status = site.status};
  }
  return bundle_at_hub_height(hub_height_m, std::vector<resx::core::SiteId>{site.site_id}, destination);
}

BundleBatch ResourceCollection::bundle_at_hub_height(int hub_height_m, const std::vector<resx::core::LatLon>& coords,
                                                     const std::optional<std::filesystem::path>& destination) const {
  if (options_.domain != resx::core::Domain::Wind) {
    return BundleBatch{.status = Status::Unsupported};
  }
  const auto sites = locator_.nearest_sites(coords);
  if (sites.status != Status::Ok) {
    return BundleBatch{.status = sites.status};
  }
  return bundle_at_hub_height(hub_height_m, sites.site_ids, destination);
}

}  // namespace resx::extraction
