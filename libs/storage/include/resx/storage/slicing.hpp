/**
 * @file slicing.hpp
 * @brief Selection helpers shared by the concrete stores.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"
#include "resx/core/types.hpp"

namespace resx::storage {

/**
 * @brief True when every index of `sel` is below `axis_length`.
 */
[[nodiscard]] bool in_range(const resx::core::Selection& sel, std::size_t axis_length) noexcept;

/**
 * @brief Gather the selected rows (time) and columns (sites) of an in-memory array.
 */
[[nodiscard]] resx::core::Slice take(const Eigen::MatrixXd& full, const resx::core::Selection& time,
                                     const resx::core::Selection& sites);

/**
 * @brief Part of a selection that falls into one shard.
 */
struct ShardPart {
  std::size_t shard{};
  std::vector<std::size_t> local{};
  std::vector<std::size_t> out_pos{};
};

/**
 * @brief Split a selection over concatenated shards.
 * @param sel Global selection; indices must be in range.
 * @param offsets Shard start offsets followed by the total length (size = shards + 1).
 * @return One part per shard touched, in shard order.
 */
[[nodiscard]] std::vector<ShardPart> partition(const resx::core::Selection& sel, const std::vector<std::size_t>& offsets);

}  // namespace resx::storage
