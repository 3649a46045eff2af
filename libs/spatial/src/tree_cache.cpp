/**
 * @file tree_cache.cpp
 * @brief Directory-backed tree cache implementation.
 * @author Watosn
 */

#include "resx/spatial/tree_cache.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace resx::spatial {
namespace {

std::string random_suffix() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  return fmt::format("{:016x}", gen());
}

}  // namespace

std::unique_ptr<DirectoryTreeCache> DirectoryTreeCache::Create(const Config& config) {
  namespace fs = std::filesystem;
  std::error_code ec;
  bool owned = false;
  fs::path dir = config.directory;
  if (dir.empty()) {
    const fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
      spdlog::error("tree cache: no temporary directory available: {}", ec.message());
      return {};
    }
    dir = tmp / fmt::format("resx-tree-cache-{}", random_suffix());
    owned = true;
  }
  fs::create_directories(dir, ec);
  if (ec || !fs::is_directory(dir)) {
    spdlog::error("tree cache: cannot create directory {}: {}", dir.string(), ec.message());
    return {};
  }
  return std::unique_ptr<DirectoryTreeCache>(new DirectoryTreeCache(std::move(dir), owned));
}

std::unique_ptr<DirectoryTreeCache> DirectoryTreeCache::Create() { return Create(Config{}); }

DirectoryTreeCache::~DirectoryTreeCache() {
  if (!owned_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(directory_, ec);
  if (ec) {
    spdlog::warn("tree cache: failed to remove scratch directory {}: {}", directory_.string(), ec.message());
  }
}

std::filesystem::path DirectoryTreeCache::path_for(const std::string& key) const {
  return directory_ / std::filesystem::path(key).filename();
}

resx::core::CacheRead DirectoryTreeCache::load(const std::string& key) const {
  const auto path = path_for(key);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return resx::core::CacheRead{.outcome = resx::core::CacheOutcome::Miss};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return resx::core::CacheRead{.outcome = resx::core::CacheOutcome::Corrupt};
  }
  std::string payload((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return resx::core::CacheRead{.outcome = resx::core::CacheOutcome::Corrupt};
  }
  return resx::core::CacheRead{.outcome = resx::core::CacheOutcome::Hit, .payload = std::move(payload)};
}

bool DirectoryTreeCache::store(const std::string& key, const std::string& payload) {
  namespace fs = std::filesystem;
  const auto target = path_for(key);
  // Readers in other processes must never observe a partially written file.
  const fs::path staging = fs::path(target).concat(fmt::format(".{}.tmp", random_suffix()));
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
      return false;
    }
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!out) {
      out.close();
      std::error_code ec;
      fs::remove(staging, ec);
      return false;
    }
  }
  std::error_code ec;
  fs::rename(staging, target, ec);
  if (ec) {
    std::error_code rm_ec;
    fs::remove(staging, rm_ec);
    return false;
  }
  return true;
}

void DirectoryTreeCache::invalidate(const std::string& key) {
  std::error_code ec;
  std::filesystem::remove(path_for(key), ec);
  if (ec) {
    spdlog::debug("tree cache: invalidate {} failed: {}", key, ec.message());
  }
}

}  // namespace resx::spatial
