/**
 * @file test_kd_tree.cpp
 * @brief k-d tree nearest-neighbor and serialization tests.
 * @author Watosn
 */

#include <cmath>
#include <cstddef>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "resx/spatial/kd_tree.hpp"

namespace {

std::size_t brute_force(const Eigen::MatrixX2d& pts, const resx::core::LatLon& q) {
  std::size_t best = 0;
  double best_d2 = std::numeric_limits<double>::infinity();
  for (Eigen::Index i = 0; i < pts.rows(); ++i) {
    const double dlat = pts(i, 0) - q.lat_deg;
    const double dlon = pts(i, 1) - q.lon_deg;
    const double d2 = dlat * dlat + dlon * dlon;
    if (d2 < best_d2) {
      best_d2 = d2;
      best = static_cast<std::size_t>(i);
    }
  }
  return best;
}

}  // namespace

int main() {
  using resx::core::LatLon;
  using resx::spatial::KdTree;

  std::mt19937 rng(20120101u);
  std::uniform_real_distribution<double> lat(24.0, 50.0);
  std::uniform_real_distribution<double> lon(-125.0, -66.0);

  Eigen::MatrixX2d pts(600, 2);
  for (Eigen::Index i = 0; i < pts.rows(); ++i) {
    pts(i, 0) = lat(rng);
    pts(i, 1) = lon(rng);
  }
  const KdTree tree = KdTree::Build(pts);
  if (tree.size() != 600 || !tree.indexes(pts)) {
    spdlog::error("tree does not index its build points");
    return 1;
  }

  std::vector<LatLon> queries;
  for (int k = 0; k < 300; ++k) {
    queries.push_back(LatLon{.lat_deg = lat(rng), .lon_deg = lon(rng)});
  }
  for (const auto& q : queries) {
    const auto got = tree.nearest(q);
    if (!got.has_value() || *got != brute_force(pts, q)) {
      spdlog::error("nearest mismatch at ({}, {})", q.lat_deg, q.lon_deg);
      return 2;
    }
  }

  const auto batch = tree.nearest(queries);
  if (batch.size() != queries.size()) {
    spdlog::error("batch size mismatch");
    return 3;
  }
  for (std::size_t k = 0; k < queries.size(); ++k) {
    if (batch[k] != brute_force(pts, queries[k])) {
      spdlog::error("batch nearest mismatch at query {}", k);
      return 4;
    }
  }

  // Query drawn from the table resolves to its own row.
  for (Eigen::Index i = 0; i < pts.rows(); i += 37) {
    const auto got = tree.nearest(LatLon{.lat_deg = pts(i, 0), .lon_deg = pts(i, 1)});
    if (!got.has_value() || *got != static_cast<std::size_t>(i)) {
      spdlog::error("table point {} did not resolve to itself", i);
      return 5;
    }
  }

  // Duplicate coordinates: first occurrence in table order wins.
  Eigen::MatrixX2d dup(40, 2);
  for (Eigen::Index i = 0; i < dup.rows(); ++i) {
    dup(i, 0) = 30.0 + static_cast<double>(i % 10);
    dup(i, 1) = -100.0 + static_cast<double>(i % 10);
  }
  const KdTree dup_tree = KdTree::Build(dup);
  for (int v = 0; v < 10; ++v) {
    const auto got = dup_tree.nearest(LatLon{.lat_deg = 30.0 + v, .lon_deg = -100.0 + v});
    if (!got.has_value() || *got != static_cast<std::size_t>(v)) {
      spdlog::error("tie at value {} resolved to {}", v, got.value_or(999));
      return 6;
    }
  }

  // Equidistant distinct points: lower row wins.
  Eigen::MatrixX2d pair(2, 2);
  pair << 41.0, -104.0, 39.0, -104.0;
  const auto mid = KdTree::Build(pair).nearest(LatLon{.lat_deg = 40.0, .lon_deg = -104.0});
  if (!mid.has_value() || *mid != 0) {
    spdlog::error("equidistant tie not broken by table order");
    return 7;
  }

  const std::string payload = tree.serialize();
  const auto restored = KdTree::Deserialize(payload);
  if (!restored.has_value() || !restored->indexes(pts) || restored->nearest(queries) != batch) {
    spdlog::error("serialized tree answers differently from the built tree");
    return 8;
  }

  std::string flipped = payload;
  flipped[flipped.size() / 2] = static_cast<char>(flipped[flipped.size() / 2] ^ 0x5a);
  if (KdTree::Deserialize(flipped).has_value()) {
    spdlog::error("corrupted payload accepted");
    return 9;
  }
  if (KdTree::Deserialize(payload.substr(0, payload.size() - 3)).has_value() ||
      KdTree::Deserialize("not a tree").has_value()) {
    spdlog::error("truncated or foreign payload accepted");
    return 10;
  }

  // Sites without finite coordinates are never chosen.
  const double nan = std::numeric_limits<double>::quiet_NaN();
  Eigen::MatrixX2d gaps(40, 2);
  for (Eigen::Index i = 0; i < gaps.rows(); ++i) {
    gaps(i, 0) = i % 3 == 0 ? nan : 30.0 + static_cast<double>(i);
    gaps(i, 1) = i % 5 == 1 ? nan : -100.0;
  }
  const KdTree gap_tree = KdTree::Build(gaps);
  for (Eigen::Index i = 0; i < gaps.rows(); ++i) {
    if (!std::isfinite(gaps(i, 0)) || !std::isfinite(gaps(i, 1))) {
      continue;
    }
    const auto got = gap_tree.nearest(LatLon{.lat_deg = gaps(i, 0), .lon_deg = -100.0});
    if (!got.has_value() || *got != static_cast<std::size_t>(i)) {
      spdlog::error("finite site {} not found next to missing coordinates", i);
      return 12;
    }
  }
  Eigen::MatrixX2d blank(3, 2);
  blank << nan, -100.0, 30.0, nan, nan, nan;
  const KdTree blank_tree = KdTree::Build(blank);
  if (blank_tree.nearest(LatLon{.lat_deg = 30.0, .lon_deg = -100.0}).has_value() ||
      !blank_tree.nearest(std::vector<LatLon>{LatLon{.lat_deg = 30.0, .lon_deg = -100.0}}).empty()) {
    spdlog::error("tree without finite coordinates returned a site");
    return 13;
  }

  const KdTree empty = KdTree::Build(Eigen::MatrixX2d(0, 2));
  if (!empty.empty() || empty.nearest(LatLon{.lat_deg = 0.0, .lon_deg = 0.0}).has_value()) {
    spdlog::error("empty tree returned a site");
    return 11;
  }

  return 0;
}
