/**
 * @file slicing.cpp
 * @brief Selection helpers shared by the concrete stores.
 * @author Watosn
 */

#include "resx/storage/slicing.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace resx::storage {

bool in_range(const resx::core::Selection& sel, std::size_t axis_length) noexcept {
  if (sel.all) {
    return true;
  }
  return std::all_of(sel.indices.begin(), sel.indices.end(), [axis_length](std::size_t i) { return i < axis_length; });
}

resx::core::Slice take(const Eigen::MatrixXd& full, const resx::core::Selection& time,
                       const resx::core::Selection& sites) {
  const auto n_time = static_cast<std::size_t>(full.rows());
  const auto n_sites = static_cast<std::size_t>(full.cols());
  if (!in_range(time, n_time) || !in_range(sites, n_sites)) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }
  if (time.all && sites.all) {
    return resx::core::Slice{.values = full};
  }

  const std::size_t rows = time.count(n_time);
  const std::size_t cols = sites.count(n_sites);
  Eigen::MatrixXd out(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
  for (std::size_t c = 0; c < cols; ++c) {
    const auto src_c = static_cast<Eigen::Index>(sites.at(c));
    for (std::size_t r = 0; r < rows; ++r) {
      out(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = full(static_cast<Eigen::Index>(time.at(r)), src_c);
    }
  }
  return resx::core::Slice{.values = std::move(out)};
}

std::vector<ShardPart> partition(const resx::core::Selection& sel, const std::vector<std::size_t>& offsets) {
  std::vector<ShardPart> parts;
  if (offsets.size() < 2) {
    return parts;
  }
  const std::size_t shards = offsets.size() - 1;
  std::vector<ShardPart> by_shard(shards);
  const std::size_t n = sel.count(offsets.back());
  for (std::size_t k = 0; k < n; ++k) {
    const std::size_t global = sel.at(k);
    const auto it = std::upper_bound(offsets.begin(), offsets.end(), global);
    const auto shard = static_cast<std::size_t>(std::distance(offsets.begin(), it)) - 1;
    by_shard[shard].shard = shard;
    by_shard[shard].local.push_back(global - offsets[shard]);
    by_shard[shard].out_pos.push_back(k);
  }
  for (auto& part : by_shard) {
    if (!part.local.empty()) {
      parts.push_back(std::move(part));
    }
  }
  return parts;
}

}  // namespace resx::storage
