/**
 * @file coordinate_index.cpp
 * @brief Coordinate index build/load/save logic.
 * @author Watosn
 */

#include "resx/spatial/coordinate_index.hpp"

#include <fstream>
#include <iterator>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "resx/core/time_axis.hpp"

namespace resx::spatial {
namespace {

constexpr std::string_view kYearKeySuffix = "tree.kdt";
constexpr std::string_view kKeySuffix = "_tree.kdt";

}  // namespace

std::string cache_key_for(std::string_view source_name) {
  const std::string name = std::filesystem::path(source_name).filename().string();
  const auto year = resx::core::parse_year(name);
  if (year.has_value()) {
    const auto at = name.find(fmt::format("{}", *year));
    return fmt::format("{}{}", name.substr(0, at), kYearKeySuffix);
  }
  const auto dot = name.rfind('.');
  const std::string stem = (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
  return fmt::format("{}{}", stem, kKeySuffix);
}

std::optional<KdTree> load_tree_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    spdlog::warn("could not open pre-computed tree {}", path.string());
    return std::nullopt;
  }
  const std::string payload((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto tree = KdTree::Deserialize(payload);
  if (!tree.has_value()) {
    spdlog::warn("could not extract tree from {}", path.string());
  }
  return tree;
}

CoordinateIndex CoordinateIndex::GetOrBuild(const Eigen::MatrixX2d& coords, const std::string& cache_key,
                                            resx::core::ITreeCache* cache) {
  if (cache != nullptr) {
    const auto read = cache->load(cache_key);
    switch (read.outcome) {
      case resx::core::CacheOutcome::Hit: {
        auto tree = KdTree::Deserialize(read.payload);
        if (!tree.has_value()) {
          spdlog::warn("could not extract tree from cache entry {}; rebuilding", cache_key);
        } else if (!tree->indexes(coords)) {
          spdlog::warn("cached tree {} does not match site coordinates; rebuilding", cache_key);
        } else {
          spdlog::debug("loaded coordinate index {} ({} sites)", cache_key, tree->size());
          return CoordinateIndex(std::move(*tree), IndexOrigin::LoadedFromCache);
        }
        cache->invalidate(cache_key);
        break;
      }
      case resx::core::CacheOutcome::Corrupt:
        spdlog::warn("cache entry {} is unreadable; rebuilding", cache_key);
        cache->invalidate(cache_key);
        break;
      case resx::core::CacheOutcome::Miss:
        break;
    }
  }

  auto tree = KdTree::Build(coords);
  spdlog::debug("built coordinate index {} ({} sites)", cache_key, tree.size());
  if (cache != nullptr && !cache->store(cache_key, tree.serialize())) {
    spdlog::warn("could not save tree to cache entry {}", cache_key);
  }
  return CoordinateIndex(std::move(tree), IndexOrigin::Built);
}

std::optional<CoordinateIndex> CoordinateIndex::Adopt(KdTree tree, const Eigen::MatrixX2d& coords) {
  if (!tree.indexes(coords)) {
    return std::nullopt;
  }
  return CoordinateIndex(std::move(tree), IndexOrigin::Supplied);
}

}  // namespace resx::spatial
