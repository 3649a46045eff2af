/**
 * @file discovery.hpp
 * @brief Shard file discovery from a directory or a `prefix*suffix` pattern.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <vector>

#include "resx/core/types.hpp"

namespace resx::storage {

/**
 * @brief Discovered shard files, sorted by file name.
 */
struct ShardFiles {
  std::vector<std::filesystem::path> files{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief One discovered file per year.
 */
struct YearFile {
  int year{};
  std::filesystem::path file{};
};

/**
 * @brief Discovered yearly files, ascending by year.
 */
struct YearFiles {
  std::vector<YearFile> files{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief List shard files.
 * @param resource_path Directory (every `.h5` file in it) or `dir/prefix*suffix`.
 * @return `NotFound` when nothing matches, `InvalidInput` for a missing directory.
 */
[[nodiscard]] ShardFiles discover_shards(const std::filesystem::path& resource_path);

/**
 * @brief List yearly files, keeping those whose names carry a year.
 * @param resource_path As for `discover_shards`.
 * @param years Years to keep; empty keeps every year found.
 * @return `NotFound` when a requested year has no file; `InvalidInput` when two files claim one year.
 */
[[nodiscard]] YearFiles discover_years(const std::filesystem::path& resource_path, const std::vector<int>& years = {});

}  // namespace resx::storage
