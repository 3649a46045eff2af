/**
 * @file bundle_exporter.hpp
 * @brief Per-site variable bundles and their SAM-style tabular export.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/interfaces.hpp"
#include "resx/core/site_table.hpp"
#include "resx/core/time_axis.hpp"
#include "resx/core/types.hpp"
#include "resx/extraction/variable_sets.hpp"

namespace resx::extraction {

/**
 * @brief Time series of several variables for one site plus its site record.
 *
 * `values` has one row per time-axis entry and one column per variable.
 */
struct SiteBundle {
  std::string name{};
  resx::core::SiteId site_id{};
  std::vector<resx::core::Timestamp> time_index{};
  std::vector<std::string> variables{};
  Eigen::MatrixXd values{};
  resx::core::SiteTable site_meta{};
};

struct BundleResult {
  SiteBundle bundle{};
  resx::core::Status status{resx::core::Status::Ok};
  resx::core::Missing missing{resx::core::Missing::None};
};

/**
 * @brief One bundle when a single site was requested, else one per site in request order.
 */
using BundleSet = std::variant<SiteBundle, std::vector<SiteBundle>>;

struct BundleBatch {
  BundleSet bundles{};
  resx::core::Status status{resx::core::Status::Ok};
  resx::core::Missing missing{resx::core::Missing::None};
};

struct ExportResult {
  std::filesystem::path file{};
  resx::core::Status status{resx::core::Status::Ok};
};

/**
 * @brief Builds site bundles from one store and writes them as delimited text.
 *
 * Exported layout:
 * - row 1: site attribute names (`Location ID` first, `timezone` as `Time Zone`, others capitalized)
 * - row 2: the site's attribute values
 * - row 3: `Year,Month,Day,Hour,Minute` and the variable names
 * - rows 4+: one row per time-axis entry
 */
class BundleExporter {
 public:
  explicit BundleExporter(const resx::core::IResourceStore& store) : store_(store) {}

  /**
   * @brief Gather every variable of `variables` for one site.
   * @return `NotFound` with `missing` set to `Site` or `Variable` when a key does not resolve.
   */
  [[nodiscard]] BundleResult build_bundle(resx::core::SiteId site_id, const VariableSet& variables) const;

  /**
   * @brief Build (and optionally export) one bundle per site; stops at the first failure.
   * @param destination Export target for every bundle, or nullopt to build only.
   */
  [[nodiscard]] BundleBatch build_bundles(const std::vector<resx::core::SiteId>& site_ids,
                                          const VariableSet& variables,
                                          const std::optional<std::filesystem::path>& destination = std::nullopt) const;

  /**
   * @brief Write a bundle.
   * @param destination A `.csv` file path, or an existing directory in which `<bundle name>.csv` is written.
   * @return `InvalidInput` when the destination directory does not exist, `DataUnavailable` on write errors.
   */
  static ExportResult export_bundle(const SiteBundle& bundle, const std::filesystem::path& destination);

 private:
  const resx::core::IResourceStore& store_;
};

}  // namespace resx::extraction
