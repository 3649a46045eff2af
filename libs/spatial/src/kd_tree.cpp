/**
 * @file kd_tree.cpp
 * @brief k-d tree construction, nearest-neighbor search and serialization.
 * @author Watosn
 */

#include "resx/spatial/kd_tree.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <numeric>

namespace resx::spatial {
namespace {

constexpr std::size_t kLeafSize = 16;
constexpr char kMagic[8] = {'R', 'E', 'S', 'X', 'K', 'D', 'T', '1'};

std::uint64_t fnv1a(std::string_view bytes) {
  std::uint64_t h = 14695981039346656037ULL;
  for (const char c : bytes) {
    h ^= static_cast<unsigned char>(c);
    h *= 1099511628211ULL;
  }
  return h;
}

template <typename T>
void put(std::string& out, const T& value) {
  char raw[sizeof(T)];
  std::memcpy(raw, &value, sizeof(T));
  out.append(raw, sizeof(T));
}

template <typename T>
bool get(std::string_view in, std::size_t& pos, T& value) {
  if (pos + sizeof(T) > in.size()) {
    return false;
  }
  std::memcpy(&value, in.data() + pos, sizeof(T));
  pos += sizeof(T);
  return true;
}

}  // namespace

KdTree KdTree::Build(const Eigen::MatrixX2d& points) {
  std::vector<std::size_t> order(static_cast<std::size_t>(points.rows()));
  std::iota(order.begin(), order.end(), std::size_t{0});
  KdTree tree(points, std::move(order));
  tree.build(0, tree.order_.size(), 0);
  return tree;
}

void KdTree::build(std::size_t lo, std::size_t hi, int depth) {
  if (hi - lo <= kLeafSize) {
    return;
  }
  const Eigen::Index axis = depth % 2;
  const std::size_t mid = lo + (hi - lo) / 2;
  const auto key_less = [this, axis](std::size_t a, std::size_t b) {
    const double va = key(a, axis);
    const double vb = key(b, axis);
    return va < vb || (va == vb && a < b);
  };
  const auto first = order_.begin();
  std::nth_element(first + static_cast<std::ptrdiff_t>(lo), first + static_cast<std::ptrdiff_t>(mid),
                   first + static_cast<std::ptrdiff_t>(hi), key_less);
  build(lo, mid, depth + 1);
  build(mid + 1, hi, depth + 1);
}

// NaN sorts after every number so the split order stays a strict weak ordering.
double KdTree::key(std::size_t idx, Eigen::Index axis) const {
  const double v = points_(static_cast<Eigen::Index>(idx), axis);
  return std::isnan(v) ? std::numeric_limits<double>::infinity() : v;
}

void KdTree::visit(std::size_t idx, const resx::core::LatLon& q, Best& best) const {
  const double dlat = points_(static_cast<Eigen::Index>(idx), 0) - q.lat_deg;
  const double dlon = points_(static_cast<Eigen::Index>(idx), 1) - q.lon_deg;
  const double d2 = dlat * dlat + dlon * dlon;
  if (!std::isfinite(d2)) {
    return;
  }
  if (!best.found || d2 < best.d2 || (d2 == best.d2 && idx < best.idx)) {
    best = Best{.d2 = d2, .idx = idx, .found = true};
  }
}

void KdTree::search(std::size_t lo, std::size_t hi, int depth, const resx::core::LatLon& q, Best& best) const {
  if (hi <= lo) {
    return;
  }
  if (hi - lo <= kLeafSize) {
    for (std::size_t k = lo; k < hi; ++k) {
      visit(order_[k], q, best);
    }
    return;
  }
  const Eigen::Index axis = depth % 2;
  const std::size_t mid = lo + (hi - lo) / 2;
  const std::size_t split_idx = order_[mid];
  visit(split_idx, q, best);

  const double qv = axis == 0 ? q.lat_deg : q.lon_deg;
  const double diff = qv - key(split_idx, axis);
  const bool go_left = diff < 0.0;
  if (go_left) {
    search(lo, mid, depth + 1, q, best);
  } else {
    search(mid + 1, hi, depth + 1, q, best);
  }
  // Points equal to the split value may sit on either side, hence the inclusive bound.
  if (diff * diff <= best.d2) {
    if (go_left) {
      search(mid + 1, hi, depth + 1, q, best);
    } else {
      search(lo, mid, depth + 1, q, best);
    }
  }
}

std::optional<resx::core::SiteId> KdTree::nearest(const resx::core::LatLon& query) const {
  if (order_.empty()) {
    return std::nullopt;
  }
  Best best{};
  search(0, order_.size(), 0, query, best);
  if (!best.found) {
    return std::nullopt;
  }
  return best.idx;
}

std::vector<resx::core::SiteId> KdTree::nearest(const std::vector<resx::core::LatLon>& queries) const {
  std::vector<resx::core::SiteId> out;
  if (order_.empty()) {
    return out;
  }
  out.reserve(queries.size());
  for (const auto& q : queries) {
    Best best{};
    search(0, order_.size(), 0, q, best);
    if (!best.found) {
      return {};
    }
    out.push_back(best.idx);
  }
  return out;
}

bool KdTree::indexes(const Eigen::MatrixX2d& points) const {
  return points.rows() == points_.rows() && points == points_;
}

std::string KdTree::serialize() const {
  std::string out;
  const std::size_t n = order_.size();
  out.reserve(sizeof(kMagic) + sizeof(std::uint64_t) * (2 + n) + sizeof(double) * 2 * n);
  out.append(kMagic, sizeof(kMagic));
  put(out, static_cast<std::uint64_t>(n));
  for (std::size_t i = 0; i < n; ++i) {
    put(out, points_(static_cast<Eigen::Index>(i), 0));
    put(out, points_(static_cast<Eigen::Index>(i), 1));
  }
  for (const std::size_t idx : order_) {
    put(out, static_cast<std::uint64_t>(idx));
  }
  put(out, fnv1a(out));
  return out;
}

std::optional<KdTree> KdTree::Deserialize(std::string_view payload) {
  if (payload.size() < sizeof(kMagic) + 2 * sizeof(std::uint64_t) ||
      std::memcmp(payload.data(), kMagic, sizeof(kMagic)) != 0) {
    return std::nullopt;
  }
  const std::string_view body = payload.substr(0, payload.size() - sizeof(std::uint64_t));
  std::size_t pos = body.size();
  std::uint64_t checksum = 0;
  if (!get(payload, pos, checksum) || checksum != fnv1a(body)) {
    return std::nullopt;
  }

  pos = sizeof(kMagic);
  std::uint64_t n = 0;
  if (!get(body, pos, n)) {
    return std::nullopt;
  }
  constexpr std::size_t kRowBytes = 2 * sizeof(double) + sizeof(std::uint64_t);
  if (n > body.size() / kRowBytes || body.size() != sizeof(kMagic) + sizeof(std::uint64_t) + n * kRowBytes) {
    return std::nullopt;
  }

  Eigen::MatrixX2d points(static_cast<Eigen::Index>(n), 2);
  for (std::uint64_t i = 0; i < n; ++i) {
    double lat = 0.0;
    double lon = 0.0;
    if (!get(body, pos, lat) || !get(body, pos, lon)) {
      return std::nullopt;
    }
    points(static_cast<Eigen::Index>(i), 0) = lat;
    points(static_cast<Eigen::Index>(i), 1) = lon;
  }

  std::vector<std::size_t> order(static_cast<std::size_t>(n));
  std::vector<bool> seen(static_cast<std::size_t>(n), false);
  for (auto& idx : order) {
    std::uint64_t raw = 0;
    if (!get(body, pos, raw) || raw >= n || seen[static_cast<std::size_t>(raw)]) {
      return std::nullopt;
    }
    seen[static_cast<std::size_t>(raw)] = true;
    idx = static_cast<std::size_t>(raw);
  }
  return KdTree(std::move(points), std::move(order));
}

}  // namespace resx::spatial
