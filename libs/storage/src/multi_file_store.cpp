/**
 * @file multi_file_store.cpp
 * @brief Spatially sharded store implementation.
 * @author Watosn
 */

#include "resx/storage/multi_file_store.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "resx/storage/slicing.hpp"

namespace resx::storage {

MultiFileComposition MultiFileResourceStore::Compose(std::vector<std::unique_ptr<resx::core::IResourceStore>> shards) {
  if (shards.empty() || std::any_of(shards.begin(), shards.end(), [](const auto& s) { return s == nullptr; })) {
    return MultiFileComposition{.status = resx::core::Status::InvalidInput};
  }

  const auto& first = *shards.front();
  auto datasets = first.datasets();
  std::sort(datasets.begin(), datasets.end());

  auto out = std::unique_ptr<MultiFileResourceStore>(new MultiFileResourceStore());
  out->offsets_.push_back(0);
  bool all_coordinates = true;
  std::vector<Eigen::MatrixX2d> coordinate_parts;
  for (const auto& shard : shards) {
    if (!(shard->time_index() == first.time_index())) {
      spdlog::error("{}: time index differs from {}", shard->source_name(), first.source_name());
      return MultiFileComposition{.status = resx::core::Status::ShardInconsistency};
    }
    auto names = shard->datasets();
    std::sort(names.begin(), names.end());
    if (names != datasets) {
      spdlog::error("{}: dataset list differs from {}", shard->source_name(), first.source_name());
      return MultiFileComposition{.status = resx::core::Status::ShardInconsistency};
    }
    auto merged = out->meta_.concat(shard->meta());
    if (!merged.has_value()) {
      spdlog::error("{}: meta columns differ from {}", shard->source_name(), first.source_name());
      return MultiFileComposition{.status = resx::core::Status::ShardInconsistency};
    }
    out->meta_ = std::move(*merged);
    out->offsets_.push_back(out->meta_.size());

    auto coords = shard->coordinates();
    if (coords.has_value()) {
      coordinate_parts.push_back(std::move(*coords));
    } else {
      all_coordinates = false;
    }
  }

  if (all_coordinates) {
    Eigen::MatrixX2d coords(static_cast<Eigen::Index>(out->meta_.size()), 2);
    Eigen::Index row = 0;
    for (const auto& part : coordinate_parts) {
      coords.middleRows(row, part.rows()) = part;
      row += part.rows();
    }
    out->coordinates_ = std::move(coords);
  }
  out->shards_ = std::move(shards);
  return MultiFileComposition{.store = std::move(out)};
}

resx::core::Slice MultiFileResourceStore::read(const std::string& name, const resx::core::Selection& time,
                                               const resx::core::Selection& sites) const {
  if (!has_dataset(name)) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }
  const std::size_t n_time = time_index().size();
  if (!in_range(time, n_time) || !in_range(sites, meta_.size())) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }

  Eigen::MatrixXd out(static_cast<Eigen::Index>(time.count(n_time)),
                      static_cast<Eigen::Index>(sites.count(meta_.size())));
  for (const auto& part : partition(sites, offsets_)) {
    const auto slice = shards_[part.shard]->read(name, time, resx::core::Selection::Of(part.local));
    if (slice.status != resx::core::Status::Ok) {
      return resx::core::Slice{.status = slice.status};
    }
    for (std::size_t k = 0; k < part.out_pos.size(); ++k) {
      out.col(static_cast<Eigen::Index>(part.out_pos[k])) = slice.values.col(static_cast<Eigen::Index>(k));
    }
  }
  return resx::core::Slice{.values = std::move(out)};
}

}  // namespace resx::storage
