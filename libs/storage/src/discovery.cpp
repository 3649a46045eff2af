/**
 * @file discovery.cpp
 * @brief Shard file discovery implementation.
 * @author Watosn
 */

#include "resx/storage/discovery.hpp"

#include <algorithm>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include "resx/core/time_axis.hpp"

namespace resx::storage {
namespace {

bool matches(const std::string& name, const std::string& prefix, const std::string& suffix) {
  return name.size() >= prefix.size() + suffix.size() && name.compare(0, prefix.size(), prefix) == 0 &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ShardFiles discover_shards(const std::filesystem::path& resource_path) {
  namespace fs = std::filesystem;
  fs::path dir = resource_path;
  std::string prefix;
  std::string suffix = ".h5";

  const std::string leaf = resource_path.filename().string();
  const auto star = leaf.find('*');
  if (star != std::string::npos) {
    dir = resource_path.parent_path();
    prefix = leaf.substr(0, star);
    suffix = leaf.substr(star + 1);
  }
  if (dir.empty()) {
    dir = ".";
  }

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    spdlog::error("resource directory not found: {}", dir.string());
    return ShardFiles{.status = resx::core::Status::InvalidInput};
  }

  ShardFiles out;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }
    if (matches(it->path().filename().string(), prefix, suffix)) {
      out.files.push_back(it->path());
    }
  }
  if (ec) {
    spdlog::error("failed to list {}: {}", dir.string(), ec.message());
    return ShardFiles{.status = resx::core::Status::DataUnavailable};
  }
  if (out.files.empty()) {
    spdlog::error("no resource files match {}", resource_path.string());
    return ShardFiles{.status = resx::core::Status::NotFound};
  }
  std::sort(out.files.begin(), out.files.end(),
            [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
  return out;
}

YearFiles discover_years(const std::filesystem::path& resource_path, const std::vector<int>& years) {
  const auto shards = discover_shards(resource_path);
  if (shards.status != resx::core::Status::Ok) {
    return YearFiles{.status = shards.status};
  }

  YearFiles out;
  for (const auto& file : shards.files) {
    const auto year = resx::core::parse_year(file.filename().string());
    if (!year.has_value()) {
      spdlog::debug("skipping {}: no year in file name", file.string());
      continue;
    }
    if (!years.empty() && std::find(years.begin(), years.end(), *year) == years.end()) {
      continue;
    }
    out.files.push_back(YearFile{.year = *year, .file = file});
  }
  std::sort(out.files.begin(), out.files.end(), [](const YearFile& a, const YearFile& b) { return a.year < b.year; });

  for (std::size_t k = 1; k < out.files.size(); ++k) {
    if (out.files[k].year == out.files[k - 1].year) {
      spdlog::error("{} and {} both hold year {}", out.files[k - 1].file.string(), out.files[k].file.string(),
                    out.files[k].year);
      return YearFiles{.status = resx::core::Status::InvalidInput};
    }
  }
  for (const int y : years) {
    const bool found = std::any_of(out.files.begin(), out.files.end(), [y](const YearFile& f) { return f.year == y; });
    if (!found) {
      spdlog::error("no file for year {} under {}", y, resource_path.string());
      return YearFiles{.status = resx::core::Status::NotFound};
    }
  }
  if (out.files.empty()) {
    return YearFiles{.status = resx::core::Status::NotFound};
  }
  return out;
}

}  // namespace resx::storage
