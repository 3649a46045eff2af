/**
 * @file multi_file_store.hpp
 * @brief Spatially sharded store: several files covering disjoint site subsets.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"

namespace resx::storage {

class MultiFileResourceStore;

/**
 * @brief Output of composing spatial shards.
 */
struct MultiFileComposition {
  std::unique_ptr<MultiFileResourceStore> store{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief Store presenting spatial shards as one site axis.
 *
 * Site ids run through the shards in order: shard k's local row r is global id
 * `offset(k) + r`. All shards share one time axis and one dataset list.
 */
class MultiFileResourceStore final : public resx::core::IResourceStore {
 public:
  /**
   * @brief Compose shards, verifying time axes, meta schemas and dataset lists agree.
   * @return `ShardInconsistency` on any mismatch, `InvalidInput` for an empty shard list.
   */
  static MultiFileComposition Compose(std::vector<std::unique_ptr<resx::core::IResourceStore>> shards);

  [[nodiscard]] std::string source_name() const override { return shards_.front()->source_name(); }
  [[nodiscard]] const resx::core::SiteTable& meta() const override { return meta_; }
  [[nodiscard]] const resx::core::TimeAxis& time_index() const override { return shards_.front()->time_index(); }
  [[nodiscard]] std::optional<Eigen::MatrixX2d> coordinates() const override { return coordinates_; }
  [[nodiscard]] std::vector<std::string> datasets() const override { return shards_.front()->datasets(); }
  [[nodiscard]] bool has_dataset(const std::string& name) const override { return shards_.front()->has_dataset(name); }
  [[nodiscard]] resx::core::Slice read(const std::string& name, const resx::core::Selection& time,
                                       const resx::core::Selection& sites) const override;

  [[nodiscard]] std::size_t shard_count() const noexcept { return shards_.size(); }
  [[nodiscard]] std::size_t offset(std::size_t shard) const noexcept { return offsets_[shard]; }

 private:
  MultiFileResourceStore() = default;

  std::vector<std::unique_ptr<resx::core::IResourceStore>> shards_{};
  std::vector<std::size_t> offsets_{};
  resx::core::SiteTable meta_{};
  std::optional<Eigen::MatrixX2d> coordinates_{};
};

}  // namespace resx::storage
