/**
 * @file memory_store.hpp
 * @brief Resource store backed by in-memory arrays.
 * @author Watosn
 */
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"

namespace resx::storage {

/**
 * @brief Resource store holding its site table, time axis and datasets in memory.
 */
class MemoryResourceStore final : public resx::core::IResourceStore {
 public:
  /**
   * @brief Store contents. Every dataset is (time steps x sites).
   */
  struct Config {
    std::string source_name{};
    resx::core::SiteTable meta{};
    resx::core::TimeAxis time_index{};
    std::optional<Eigen::MatrixX2d> coordinates{};
    std::map<std::string, Eigen::MatrixXd> datasets{};
  };

  /**
   * @brief Factory helper that validates dataset and coordinate shapes.
   * @return Null pointer when any array disagrees with the site table or time axis.
   */
  static std::unique_ptr<MemoryResourceStore> Create(Config config);

  [[nodiscard]] std::string source_name() const override { return config_.source_name; }
  [[nodiscard]] const resx::core::SiteTable& meta() const override { return config_.meta; }
  [[nodiscard]] const resx::core::TimeAxis& time_index() const override { return config_.time_index; }
  [[nodiscard]] std::optional<Eigen::MatrixX2d> coordinates() const override { return config_.coordinates; }
  [[nodiscard]] std::vector<std::string> datasets() const override;
  [[nodiscard]] bool has_dataset(const std::string& name) const override { return config_.datasets.count(name) != 0; }
  [[nodiscard]] resx::core::Slice read(const std::string& name, const resx::core::Selection& time,
                                       const resx::core::Selection& sites) const override;

 private:
  explicit MemoryResourceStore(Config config) : config_(std::move(config)) {}

  Config config_{};
};

}  // namespace resx::storage
