/**
 * @file memory_store.cpp
 * @brief In-memory resource store implementation.
 * @author Watosn
 */

#include "resx/storage/memory_store.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "resx/storage/slicing.hpp"

namespace resx::storage {

std::unique_ptr<MemoryResourceStore> MemoryResourceStore::Create(Config config) {
  const auto n_sites = static_cast<Eigen::Index>(config.meta.size());
  const auto n_time = static_cast<Eigen::Index>(config.time_index.size());
  if (config.coordinates.has_value() && config.coordinates->rows() != n_sites) {
    spdlog::error("{}: coordinates have {} rows for {} sites", config.source_name, config.coordinates->rows(), n_sites);
    return {};
  }
  for (const auto& [name, values] : config.datasets) {
    if (values.rows() != n_time || values.cols() != n_sites) {
      spdlog::error("{}: dataset {} is {}x{}, expected {}x{}", config.source_name, name, values.rows(), values.cols(),
                    n_time, n_sites);
      return {};
    }
  }
  return std::unique_ptr<MemoryResourceStore>(new MemoryResourceStore(std::move(config)));
}

std::vector<std::string> MemoryResourceStore::datasets() const {
  std::vector<std::string> out;
  out.reserve(config_.datasets.size());
  for (const auto& entry : config_.datasets) {
    out.push_back(entry.first);
  }
  return out;
}

resx::core::Slice MemoryResourceStore::read(const std::string& name, const resx::core::Selection& time,
                                            const resx::core::Selection& sites) const {
  const auto it = config_.datasets.find(name);
  if (it == config_.datasets.end()) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }
  return take(it->second, time, sites);
}

}  // namespace resx::storage
