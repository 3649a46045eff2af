/**
 * @file interfaces.hpp
 * @brief Storage and index-cache collaborator interfaces.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/site_table.hpp"
#include "resx/core/time_axis.hpp"
#include "resx/core/types.hpp"

namespace resx::core {

/**
 * @brief Raw dataset slice, rows = time positions, columns = sites.
 */
struct Slice {
  Eigen::MatrixXd values{};
  Status status{Status::Ok};
};

/**
 * @brief Interface for stores exposing a (dataset, time, site) array space.
 *
 * Site ids are row positions of `meta()`; time positions index `time_index()`.
 */
class IResourceStore {
 public:
  virtual ~IResourceStore() = default;

  /**
   * @brief Identifier the index cache key is derived from (usually a file name).
   */
  [[nodiscard]] virtual std::string source_name() const = 0;

  [[nodiscard]] virtual const SiteTable& meta() const = 0;
  [[nodiscard]] virtual const TimeAxis& time_index() const = 0;

  /**
   * @brief Direct (lat, lon) table when the store carries one.
   */
  [[nodiscard]] virtual std::optional<Eigen::MatrixX2d> coordinates() const = 0;

  [[nodiscard]] virtual std::vector<std::string> datasets() const = 0;
  [[nodiscard]] virtual bool has_dataset(const std::string& name) const = 0;

  /**
   * @brief Read a dataset slice.
   * @param name Dataset name.
   * @param time Time positions to read.
   * @param sites Site ids to read.
   * @return Slice with `status` set: `NotFound` for unknown names or out-of-range indices.
   */
  [[nodiscard]] virtual Slice read(const std::string& name, const Selection& time, const Selection& sites) const = 0;
};

/**
 * @brief Outcome of a cache lookup.
 */
enum class CacheOutcome : std::uint8_t { Hit, Miss, Corrupt };

/**
 * @brief Result of a cache lookup; `payload` is meaningful only on `Hit`.
 */
struct CacheRead {
  CacheOutcome outcome{CacheOutcome::Miss};
  std::string payload{};
};

/**
 * @brief Interface for the scratch cache holding serialized spatial indexes.
 */
class ITreeCache {
 public:
  virtual ~ITreeCache() = default;

  [[nodiscard]] virtual CacheRead load(const std::string& key) const = 0;

  /**
   * @brief Persist a payload under `key`.
   * @return False when the payload could not be written.
   */
  virtual bool store(const std::string& key, const std::string& payload) = 0;

  virtual void invalidate(const std::string& key) = 0;
};

}  // namespace resx::core
