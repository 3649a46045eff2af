/**
 * @file tree_cache.hpp
 * @brief Directory-backed scratch cache for serialized spatial indexes.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "resx/core/interfaces.hpp"

namespace resx::spatial {

/**
 * @brief Tree cache storing one file per cache key under a directory.
 *
 * With no directory configured, a private scratch directory is created under the
 * system temporary path and removed when the cache is destroyed.
 */
class DirectoryTreeCache final : public resx::core::ITreeCache {
 public:
  /**
   * @brief Cache configuration.
   */
  struct Config {
    std::filesystem::path directory{};
  };

  /**
   * @brief Factory helper that prepares the cache directory.
   * @return Null pointer when the directory cannot be created.
   */
  static std::unique_ptr<DirectoryTreeCache> Create(const Config& config);
  static std::unique_ptr<DirectoryTreeCache> Create();

  ~DirectoryTreeCache() override;
  DirectoryTreeCache(const DirectoryTreeCache&) = delete;
  DirectoryTreeCache& operator=(const DirectoryTreeCache&) = delete;

  [[nodiscard]] resx::core::CacheRead load(const std::string& key) const override;
  bool store(const std::string& key, const std::string& payload) override;
  void invalidate(const std::string& key) override;

  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
  [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;

 private:
  DirectoryTreeCache(std::filesystem::path directory, bool owned)
      : directory_(std::move(directory)), owned_(owned) {}

  std::filesystem::path directory_{};
  bool owned_{};
};

}  // namespace resx::spatial
