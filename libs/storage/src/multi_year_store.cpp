/**
 * @file multi_year_store.cpp
 * @brief Temporally sharded store implementation.
 * @author Watosn
 */

#include "resx/storage/multi_year_store.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "resx/storage/slicing.hpp"

namespace resx::storage {
namespace {

std::optional<Eigen::MatrixX2d> site_coordinates(const resx::core::IResourceStore& store) {
  auto coords = store.coordinates();
  if (coords.has_value()) {
    return coords;
  }
  return store.meta().lat_lon();
}

}  // namespace

MultiYearComposition MultiYearResourceStore::Compose(std::vector<YearShard> shards) {
  if (shards.empty() ||
      std::any_of(shards.begin(), shards.end(), [](const YearShard& s) { return s.store == nullptr; })) {
    return MultiYearComposition{.status = resx::core::Status::InvalidInput};
  }
  std::sort(shards.begin(), shards.end(), [](const YearShard& a, const YearShard& b) { return a.year < b.year; });

  const auto& first = *shards.front().store;
  const auto reference = site_coordinates(first);
  auto out = std::unique_ptr<MultiYearResourceStore>(new MultiYearResourceStore());
  out->offsets_.push_back(0);
  for (std::size_t k = 0; k < shards.size(); ++k) {
    const auto& store = *shards[k].store;
    if (k > 0 && shards[k].year == shards[k - 1].year) {
      spdlog::error("{}: year {} supplied twice", store.source_name(), shards[k].year);
      return MultiYearComposition{.status = resx::core::Status::ShardInconsistency};
    }
    if (store.meta().size() != first.meta().size()) {
      spdlog::error("{}: {} sites, {} has {}", store.source_name(), store.meta().size(), first.source_name(),
                    first.meta().size());
      return MultiYearComposition{.status = resx::core::Status::ShardInconsistency};
    }
    const auto coords = site_coordinates(store);
    if (coords.has_value() != reference.has_value() || (coords.has_value() && !(*coords == *reference))) {
      spdlog::error("{}: site coordinates differ from {}", store.source_name(), first.source_name());
      return MultiYearComposition{.status = resx::core::Status::ShardInconsistency};
    }
    auto merged = out->time_index_.concat(store.time_index());
    if (!merged.has_value()) {
      spdlog::error("{}: time index overlaps the preceding years", store.source_name());
      return MultiYearComposition{.status = resx::core::Status::ShardInconsistency};
    }
    out->time_index_ = std::move(*merged);
    out->offsets_.push_back(out->time_index_.size());
  }

  for (const auto& name : first.datasets()) {
    const bool everywhere = std::all_of(shards.begin(), shards.end(),
                                        [&name](const YearShard& s) { return s.store->has_dataset(name); });
    if (everywhere) {
      out->datasets_.push_back(name);
    } else {
      spdlog::warn("dataset {} is missing from some years; it is not exposed", name);
    }
  }
  out->shards_ = std::move(shards);
  return MultiYearComposition{.store = std::move(out)};
}

bool MultiYearResourceStore::has_dataset(const std::string& name) const {
  return std::find(datasets_.begin(), datasets_.end(), name) != datasets_.end();
}

std::vector<int> MultiYearResourceStore::years() const {
  std::vector<int> out;
  out.reserve(shards_.size());
  for (const auto& s : shards_) {
    out.push_back(s.year);
  }
  return out;
}

std::optional<std::vector<std::size_t>> MultiYearResourceStore::positions_for(const std::vector<int>& years) const {
  std::vector<std::size_t> out;
  for (std::size_t k = 0; k < shards_.size(); ++k) {
    if (std::find(years.begin(), years.end(), shards_[k].year) == years.end()) {
      continue;
    }
    for (std::size_t p = offsets_[k]; p < offsets_[k + 1]; ++p) {
      out.push_back(p);
    }
  }
  for (const int y : years) {
    if (shard(y) == nullptr) {
      return std::nullopt;
    }
  }
  return out;
}

const resx::core::IResourceStore* MultiYearResourceStore::shard(int year) const {
  for (const auto& s : shards_) {
    if (s.year == year) {
      return s.store.get();
    }
  }
  return nullptr;
}

resx::core::Slice MultiYearResourceStore::read(const std::string& name, const resx::core::Selection& time,
                                               const resx::core::Selection& sites) const {
  if (!has_dataset(name)) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }
  const std::size_t n_sites = meta().size();
  if (!in_range(time, time_index_.size()) || !in_range(sites, n_sites)) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }

  Eigen::MatrixXd out(static_cast<Eigen::Index>(time.count(time_index_.size())),
                      static_cast<Eigen::Index>(sites.count(n_sites)));
  for (const auto& part : partition(time, offsets_)) {
    const auto slice = shards_[part.shard].store->read(name, resx::core::Selection::Of(part.local), sites);
    if (slice.status != resx::core::Status::Ok) {
      return resx::core::Slice{.status = slice.status};
    }
    for (std::size_t k = 0; k < part.out_pos.size(); ++k) {
      out.row(static_cast<Eigen::Index>(part.out_pos[k])) = slice.values.row(static_cast<Eigen::Index>(k));
    }
  }
  return resx::core::Slice{.values = std::move(out)};
}

}  // namespace resx::storage
