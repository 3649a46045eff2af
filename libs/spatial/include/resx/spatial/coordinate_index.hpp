/**
 * @file coordinate_index.hpp
 * @brief Cached nearest-neighbor index over a site coordinate table.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"
#include "resx/core/types.hpp"
#include "resx/spatial/kd_tree.hpp"

namespace resx::spatial {

/**
 * @brief How an index came to exist.
 */
enum class IndexOrigin : std::uint8_t { Built, LoadedFromCache, Supplied };

/**
 * @brief Derive the cache key for a collection source name.
 *
 * A name carrying a year token maps to the text before the year plus `tree.kdt`,
 * so same-prefix yearly files share one key. Other names get their extension
 * replaced by `_tree.kdt`.
 */
[[nodiscard]] std::string cache_key_for(std::string_view source_name);

/**
 * @brief Load a serialized tree from an explicit file.
 * @return Empty optional (with a warning logged) on any read or decode failure.
 */
[[nodiscard]] std::optional<KdTree> load_tree_file(const std::filesystem::path& path);

/**
 * @brief Nearest-neighbor index over (lat, lon) site coordinates.
 */
class CoordinateIndex {
 public:
  /**
   * @brief Load the index cached under `cache_key`, or build and persist it.
   *
   * Unreadable, corrupt or stale cache entries degrade to a rebuild; they are
   * logged and never reported to the caller.
   * @param coords Site coordinates, one row per site id.
   * @param cache_key Key from `cache_key_for`.
   * @param cache Cache provider, or null to skip persistence.
   */
  static CoordinateIndex GetOrBuild(const Eigen::MatrixX2d& coords, const std::string& cache_key,
                                    resx::core::ITreeCache* cache);

  /**
   * @brief Adopt a caller-supplied tree when it indexes `coords`.
   */
  static std::optional<CoordinateIndex> Adopt(KdTree tree, const Eigen::MatrixX2d& coords);

  [[nodiscard]] std::optional<resx::core::SiteId> nearest(const resx::core::LatLon& point) const {
    return tree_.nearest(point);
  }
  [[nodiscard]] std::vector<resx::core::SiteId> nearest(const std::vector<resx::core::LatLon>& points) const {
    return tree_.nearest(points);
  }

  [[nodiscard]] std::size_t size() const noexcept { return tree_.size(); }
  [[nodiscard]] IndexOrigin origin() const noexcept { return origin_; }
  [[nodiscard]] const KdTree& tree() const noexcept { return tree_; }

 private:
  CoordinateIndex(KdTree tree, IndexOrigin origin) : tree_(std::move(tree)), origin_(origin) {}

  KdTree tree_{};
  IndexOrigin origin_{IndexOrigin::Built};
};

}  // namespace resx::spatial
