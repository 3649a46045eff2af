/**
 * @file h5_store.hpp
 * @brief Resource store backed by one HDF5 resource file.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <hdf5.h>

#include "resx/core/interfaces.hpp"

namespace resx::storage {

/**
 * @brief Owning HDF5 identifier, released with the matching close call.
 */
class H5Handle {
 public:
  using Closer = herr_t (*)(hid_t);

  H5Handle() = default;
  H5Handle(hid_t id, Closer closer) noexcept : id_(id), closer_(closer) {}
  ~H5Handle() { reset(); }

  H5Handle(const H5Handle&) = delete;
  H5Handle& operator=(const H5Handle&) = delete;
  H5Handle(H5Handle&& other) noexcept : id_(other.id_), closer_(other.closer_) { other.id_ = H5I_INVALID_HID; }
  H5Handle& operator=(H5Handle&& other) noexcept {
    if (this != &other) {
      reset();
      id_ = other.id_;
      closer_ = other.closer_;
      other.id_ = H5I_INVALID_HID;
    }
    return *this;
  }

  [[nodiscard]] hid_t get() const noexcept { return id_; }
  [[nodiscard]] bool valid() const noexcept { return id_ >= 0; }

  void reset() noexcept {
    if (id_ >= 0 && closer_ != nullptr) {
      closer_(id_);
    }
    id_ = H5I_INVALID_HID;
  }

 private:
  hid_t id_{H5I_INVALID_HID};
  Closer closer_{nullptr};
};

/**
 * @brief Read-only view of a resource `.h5` file.
 *
 * Expected layout: a `meta` compound table (one record per site), a `time_index`
 * string dataset, an optional `coordinates` (sites x 2) dataset and any number of
 * 2-D (time, sites) numeric datasets. Datasets carrying a `scale_factor`
 * attribute are divided by it on read.
 */
class H5ResourceStore final : public resx::core::IResourceStore {
 public:
  /**
   * @brief Store configuration.
   */
  struct Config {
    std::filesystem::path file{};
    bool unscale{true};
  };

  /**
   * @brief Open the file and load its site table and time axis.
   * @return Null pointer when the file cannot be opened or lacks `meta`/`time_index`.
   */
  static std::unique_ptr<H5ResourceStore> Open(const Config& config);

  [[nodiscard]] std::string source_name() const override { return config_.file.filename().string(); }
  [[nodiscard]] const resx::core::SiteTable& meta() const override { return meta_; }
  [[nodiscard]] const resx::core::TimeAxis& time_index() const override { return time_index_; }
  [[nodiscard]] std::optional<Eigen::MatrixX2d> coordinates() const override { return coordinates_; }
  [[nodiscard]] std::vector<std::string> datasets() const override;
  [[nodiscard]] bool has_dataset(const std::string& name) const override { return scale_factors_.count(name) != 0; }
  [[nodiscard]] resx::core::Slice read(const std::string& name, const resx::core::Selection& time,
                                       const resx::core::Selection& sites) const override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return config_.file; }

 private:
  H5ResourceStore(Config config, H5Handle file) : config_(std::move(config)), file_(std::move(file)) {}

  bool load_meta();
  bool load_time_index();
  void load_coordinates();
  void scan_datasets();

  Config config_{};
  H5Handle file_{};
  resx::core::SiteTable meta_{};
  resx::core::TimeAxis time_index_{};
  std::optional<Eigen::MatrixX2d> coordinates_{};
  std::map<std::string, double> scale_factors_{};
};

}  // namespace resx::storage
