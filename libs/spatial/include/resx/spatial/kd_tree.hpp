/**
 * @file kd_tree.hpp
 * @brief Two-dimensional k-d tree over (lat, lon) site coordinates.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/types.hpp"

namespace resx::spatial {

/**
 * @brief Static k-d tree answering planar nearest-neighbor queries.
 *
 * Distances are Euclidean in degree space. Equidistant candidates resolve to the
 * lowest row index. Rows with a non-finite coordinate are never returned.
 */
class KdTree {
 public:
  KdTree() = default;

  /**
   * @brief Build over rows of `points` (column 0 latitude, column 1 longitude).
   */
  static KdTree Build(const Eigen::MatrixX2d& points);

  /**
   * @brief Rebuild a tree from `serialize()` output.
   * @return Empty optional on truncated, corrupted or foreign payloads.
   */
  static std::optional<KdTree> Deserialize(std::string_view payload);

  [[nodiscard]] std::string serialize() const;

  [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
  [[nodiscard]] bool empty() const noexcept { return order_.empty(); }
  [[nodiscard]] const Eigen::MatrixX2d& points() const noexcept { return points_; }

  /**
   * @brief True when the tree indexes exactly `points`, row for row.
   */
  [[nodiscard]] bool indexes(const Eigen::MatrixX2d& points) const;

  /**
   * @brief Row index nearest to `query`; nullopt when no row has finite coordinates.
   */
  [[nodiscard]] std::optional<resx::core::SiteId> nearest(const resx::core::LatLon& query) const;

  /**
   * @brief Nearest row index per query, in query order; empty when no row has finite coordinates.
   */
  [[nodiscard]] std::vector<resx::core::SiteId> nearest(const std::vector<resx::core::LatLon>& queries) const;

 private:
  struct Best {
    double d2{std::numeric_limits<double>::infinity()};
    std::size_t idx{};
    bool found{};
  };

  KdTree(Eigen::MatrixX2d points, std::vector<std::size_t> order)
      : points_(std::move(points)), order_(std::move(order)) {}

  void build(std::size_t lo, std::size_t hi, int depth);
  void search(std::size_t lo, std::size_t hi, int depth, const resx::core::LatLon& q, Best& best) const;
  [[nodiscard]] double key(std::size_t idx, Eigen::Index axis) const;
  void visit(std::size_t idx, const resx::core::LatLon& q, Best& best) const;

  Eigen::MatrixX2d points_{};
  std::vector<std::size_t> order_{};
};

}  // namespace resx::spatial
