/**
 * @file multi_year_store.hpp
 * @brief Temporally sharded store: one file per year over the same sites.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"

namespace resx::storage {

class MultiYearResourceStore;

/**
 * @brief Output of composing yearly shards.
 */
struct MultiYearComposition {
  std::unique_ptr<MultiYearResourceStore> store{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief One yearly shard.
 */
struct YearShard {
  int year{};
  std::unique_ptr<resx::core::IResourceStore> store{};
};

/**
 * @brief Store presenting yearly shards as one continuous time axis.
 *
 * The site table of the first (earliest) shard is authoritative; every other
 * shard must have the same number of sites at the same coordinates.
 */
class MultiYearResourceStore final : public resx::core::IResourceStore {
 public:
  /**
   * @brief Order shards by year and verify they agree on sites.
   * @return `ShardInconsistency` for differing site tables, repeated years or overlapping
   * time axes; `InvalidInput` for an empty shard list.
   */
  static MultiYearComposition Compose(std::vector<YearShard> shards);

  [[nodiscard]] std::string source_name() const override { return shards_.front().store->source_name(); }
  [[nodiscard]] const resx::core::SiteTable& meta() const override { return shards_.front().store->meta(); }
  [[nodiscard]] const resx::core::TimeAxis& time_index() const override { return time_index_; }
  [[nodiscard]] std::optional<Eigen::MatrixX2d> coordinates() const override {
    return shards_.front().store->coordinates();
  }
  [[nodiscard]] std::vector<std::string> datasets() const override { return datasets_; }
  [[nodiscard]] bool has_dataset(const std::string& name) const override;
  [[nodiscard]] resx::core::Slice read(const std::string& name, const resx::core::Selection& time,
                                       const resx::core::Selection& sites) const override;

  /**
   * @brief Years available, ascending.
   */
  [[nodiscard]] std::vector<int> years() const;

  /**
   * @brief Global time positions covered by `years`, ascending; nullopt if any year is absent.
   */
  [[nodiscard]] std::optional<std::vector<std::size_t>> positions_for(const std::vector<int>& years) const;

  [[nodiscard]] const resx::core::IResourceStore* shard(int year) const;

 private:
  MultiYearResourceStore() = default;

  std::vector<YearShard> shards_{};
  std::vector<std::size_t> offsets_{};
  resx::core::TimeAxis time_index_{};
  std::vector<std::string> datasets_{};
};

}  // namespace resx::storage
