/**
 * @file h5_store.cpp
 * @brief HDF5 resource store implementation.
 * @author Watosn
 */

#include "resx/storage/h5_store.hpp"

#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

#include "resx/storage/slicing.hpp"

namespace resx::storage {
namespace {

constexpr const char* kMeta = "meta";
constexpr const char* kTimeIndex = "time_index";
constexpr const char* kCoordinates = "coordinates";
constexpr const char* kScaleFactor = "scale_factor";

bool link_exists(hid_t loc, const char* name) { return H5Lexists(loc, name, H5P_DEFAULT) > 0; }

std::size_t element_count(hid_t dataset) {
  H5Handle space(H5Dget_space(dataset), H5Sclose);
  if (!space.valid()) {
    return 0;
  }
  const hssize_t n = H5Sget_simple_extent_npoints(space.get());
  return n > 0 ? static_cast<std::size_t>(n) : 0;
}

std::vector<hsize_t> extent(hid_t dataset) {
  H5Handle space(H5Dget_space(dataset), H5Sclose);
  if (!space.valid()) {
    return {};
  }
  const int rank = H5Sget_simple_extent_ndims(space.get());
  if (rank <= 0) {
    return {};
  }
  std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
  if (H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr) < 0) {
    return {};
  }
  return dims;
}

std::string trim_fixed(const char* raw, std::size_t width) {
  std::size_t len = strnlen(raw, width);
  while (len > 0 && raw[len - 1] == ' ') {
    --len;
  }
  return std::string(raw, len);
}

herr_t reclaim_vlen(hid_t mem_type, hid_t space, void* buf) {
#if H5_VERSION_GE(1, 12, 0)
  return H5Treclaim(mem_type, space, H5P_DEFAULT, buf);
#else
  return H5Dvlen_reclaim(mem_type, space, H5P_DEFAULT, buf);
#endif
}

// Reads string values through `mem_type_for`, which wraps a C string type into the
// in-memory layout expected by the read (plain, or a one-member compound).
template <typename WrapFn>
std::optional<std::vector<std::string>> read_strings(hid_t dataset, hid_t file_str_type, std::size_t n,
                                                     WrapFn mem_type_for) {
  std::vector<std::string> out;
  out.reserve(n);
  if (H5Tis_variable_str(file_str_type) > 0) {
    H5Handle str(H5Tcopy(H5T_C_S1), H5Tclose);
    if (!str.valid() || H5Tset_size(str.get(), H5T_VARIABLE) < 0) {
      return std::nullopt;
    }
    H5Handle mem = mem_type_for(str.get(), sizeof(char*));
    std::vector<char*> buf(n, nullptr);
    if (!mem.valid() || H5Dread(dataset, mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data()) < 0) {
      return std::nullopt;
    }
    for (const char* s : buf) {
      out.emplace_back(s != nullptr ? s : "");
    }
    H5Handle space(H5Dget_space(dataset), H5Sclose);
    if (space.valid() && reclaim_vlen(mem.get(), space.get(), buf.data()) < 0) {
      spdlog::debug("h5: failed to reclaim variable-length strings");
    }
    return out;
  }

  const std::size_t width = H5Tget_size(file_str_type);
  if (width == 0) {
    return std::nullopt;
  }
  H5Handle str(H5Tcopy(H5T_C_S1), H5Tclose);
  if (!str.valid() || H5Tset_size(str.get(), width) < 0 || H5Tset_strpad(str.get(), H5T_STR_NULLPAD) < 0) {
    return std::nullopt;
  }
  H5Handle mem = mem_type_for(str.get(), width);
  std::vector<char> buf(n * width, '\0');
  if (!mem.valid() || H5Dread(dataset, mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data()) < 0) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(trim_fixed(buf.data() + i * width, width));
  }
  return out;
}

H5Handle compound_of(const std::string& member, hid_t member_type, std::size_t size) {
  H5Handle mem(H5Tcreate(H5T_COMPOUND, size), H5Tclose);
  if (!mem.valid() || H5Tinsert(mem.get(), member.c_str(), 0, member_type) < 0) {
    return {};
  }
  return mem;
}

}  // namespace

std::unique_ptr<H5ResourceStore> H5ResourceStore::Open(const Config& config) {
  H5Handle file(H5Fopen(config.file.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
  if (!file.valid()) {
    spdlog::error("failed to open resource file: {}", config.file.string());
    return {};
  }
  auto out = std::unique_ptr<H5ResourceStore>(new H5ResourceStore(config, std::move(file)));
  if (!out->load_meta()) {
    spdlog::error("{}: missing or unreadable meta table", config.file.string());
    return {};
  }
  if (!out->load_time_index()) {
    spdlog::error("{}: missing or unreadable time_index", config.file.string());
    return {};
  }
  out->load_coordinates();
  out->scan_datasets();
  return out;
}

bool H5ResourceStore::load_meta() {
  if (!link_exists(file_.get(), kMeta)) {
    return false;
  }
  H5Handle ds(H5Dopen2(file_.get(), kMeta, H5P_DEFAULT), H5Dclose);
  if (!ds.valid()) {
    return false;
  }
  H5Handle type(H5Dget_type(ds.get()), H5Tclose);
  if (!type.valid() || H5Tget_class(type.get()) != H5T_COMPOUND) {
    return false;
  }
  const std::size_t n = element_count(ds.get());
  const int members = H5Tget_nmembers(type.get());
  std::vector<resx::core::Column> columns;
  for (int m = 0; m < members; ++m) {
    char* raw_name = H5Tget_member_name(type.get(), static_cast<unsigned>(m));
    if (raw_name == nullptr) {
      continue;
    }
    const std::string name(raw_name);
    H5free_memory(raw_name);

    H5Handle member_type(H5Tget_member_type(type.get(), static_cast<unsigned>(m)), H5Tclose);
    const H5T_class_t cls = H5Tget_class(member_type.get());
    if (cls == H5T_INTEGER || cls == H5T_FLOAT) {
      H5Handle mem = compound_of(name, H5T_NATIVE_DOUBLE, sizeof(double));
      std::vector<double> values(n, 0.0);
      if (!mem.valid() || H5Dread(ds.get(), mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) < 0) {
        return false;
      }
      columns.push_back(resx::core::Column{.name = name, .kind = resx::core::ColumnKind::Numeric, .numbers = std::move(values)});
    } else if (cls == H5T_STRING) {
      auto values = read_strings(ds.get(), member_type.get(), n,
                                 [&name](hid_t str, std::size_t size) { return compound_of(name, str, size); });
      if (!values.has_value()) {
        return false;
      }
      columns.push_back(resx::core::Column{.name = name, .kind = resx::core::ColumnKind::Text, .strings = std::move(*values)});
    } else {
      spdlog::debug("{}: skipping meta member {} of unsupported type", config_.file.string(), name);
    }
  }
  auto table = resx::core::SiteTable::FromColumns(std::move(columns));
  if (!table.has_value()) {
    return false;
  }
  meta_ = std::move(*table);
  return true;
}

bool H5ResourceStore::load_time_index() {
  if (!link_exists(file_.get(), kTimeIndex)) {
    return false;
  }
  H5Handle ds(H5Dopen2(file_.get(), kTimeIndex, H5P_DEFAULT), H5Dclose);
  if (!ds.valid()) {
    return false;
  }
  H5Handle type(H5Dget_type(ds.get()), H5Tclose);
  if (!type.valid() || H5Tget_class(type.get()) != H5T_STRING) {
    return false;
  }
  const auto stamps = read_strings(ds.get(), type.get(), element_count(ds.get()), [](hid_t str, std::size_t) {
    return H5Handle(H5Tcopy(str), H5Tclose);
  });
  if (!stamps.has_value()) {
    return false;
  }
  auto axis = resx::core::TimeAxis::FromStrings(*stamps);
  if (!axis.has_value()) {
    return false;
  }
  time_index_ = std::move(*axis);
  return true;
}

void H5ResourceStore::load_coordinates() {
  if (!link_exists(file_.get(), kCoordinates)) {
    return;
  }
  H5Handle ds(H5Dopen2(file_.get(), kCoordinates, H5P_DEFAULT), H5Dclose);
  const auto dims = ds.valid() ? extent(ds.get()) : std::vector<hsize_t>{};
  if (dims.size() != 2 || dims[1] != 2 || dims[0] != meta_.size()) {
    spdlog::warn("{}: ignoring malformed coordinates dataset", config_.file.string());
    return;
  }
  std::vector<double> buf(static_cast<std::size_t>(dims[0] * 2));
  if (H5Dread(ds.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data()) < 0) {
    spdlog::warn("{}: failed to read coordinates dataset", config_.file.string());
    return;
  }
  Eigen::MatrixX2d coords(static_cast<Eigen::Index>(dims[0]), 2);
  for (Eigen::Index i = 0; i < coords.rows(); ++i) {
    coords(i, 0) = buf[static_cast<std::size_t>(2 * i)];
    coords(i, 1) = buf[static_cast<std::size_t>(2 * i + 1)];
  }
  coordinates_ = std::move(coords);
}

void H5ResourceStore::scan_datasets() {
  H5G_info_t info{};
  if (H5Gget_info(file_.get(), &info) < 0) {
    return;
  }
  for (hsize_t i = 0; i < info.nlinks; ++i) {
    const ssize_t len = H5Lget_name_by_idx(file_.get(), ".", H5_INDEX_NAME, H5_ITER_INC, i, nullptr, 0, H5P_DEFAULT);
    if (len <= 0) {
      continue;
    }
    std::string name(static_cast<std::size_t>(len) + 1, '\0');
    if (H5Lget_name_by_idx(file_.get(), ".", H5_INDEX_NAME, H5_ITER_INC, i, name.data(), name.size(), H5P_DEFAULT) < 0) {
      continue;
    }
    name.resize(static_cast<std::size_t>(len));
    if (name == kMeta || name == kTimeIndex || name == kCoordinates) {
      continue;
    }

    H5Handle obj(H5Oopen(file_.get(), name.c_str(), H5P_DEFAULT), H5Oclose);
    if (!obj.valid() || H5Iget_type(obj.get()) != H5I_DATASET) {
      continue;
    }
    H5Handle type(H5Dget_type(obj.get()), H5Tclose);
    const H5T_class_t cls = type.valid() ? H5Tget_class(type.get()) : H5T_NO_CLASS;
    const auto dims = extent(obj.get());
    if ((cls != H5T_INTEGER && cls != H5T_FLOAT) || dims.size() != 2 || dims[0] != time_index_.size() ||
        dims[1] != meta_.size()) {
      continue;
    }

    double scale = 1.0;
    if (config_.unscale && H5Aexists(obj.get(), kScaleFactor) > 0) {
      H5Handle attr(H5Aopen(obj.get(), kScaleFactor, H5P_DEFAULT), H5Aclose);
      double value = 1.0;
      if (attr.valid() && H5Aread(attr.get(), H5T_NATIVE_DOUBLE, &value) >= 0 && value != 0.0) {
        scale = value;
      }
    }
    scale_factors_.emplace(std::move(name), scale);
  }
}

std::vector<std::string> H5ResourceStore::datasets() const {
  std::vector<std::string> out;
  out.reserve(scale_factors_.size());
  for (const auto& entry : scale_factors_) {
    out.push_back(entry.first);
  }
  return out;
}

resx::core::Slice H5ResourceStore::read(const std::string& name, const resx::core::Selection& time,
                                        const resx::core::Selection& sites) const {
  const auto it = scale_factors_.find(name);
  if (it == scale_factors_.end()) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }
  const std::size_t n_time = time_index_.size();
  const std::size_t n_sites = meta_.size();
  if (!in_range(time, n_time) || !in_range(sites, n_sites)) {
    return resx::core::Slice{.status = resx::core::Status::NotFound};
  }

  H5Handle ds(H5Dopen2(file_.get(), name.c_str(), H5P_DEFAULT), H5Dclose);
  H5Handle file_space(ds.valid() ? H5Dget_space(ds.get()) : H5I_INVALID_HID, H5Sclose);
  if (!file_space.valid()) {
    return resx::core::Slice{.status = resx::core::Status::DataUnavailable};
  }

  const std::size_t rows = time.count(n_time);
  const std::size_t cols = sites.count(n_sites);
  Eigen::MatrixXd out(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));

  if (sites.all) {
    // Row-wise reads: one hyperslab per selected time step.
    std::vector<double> row(n_sites);
    const hsize_t count[2] = {1, n_sites};
    H5Handle mem_space(H5Screate_simple(2, count, nullptr), H5Sclose);
    for (std::size_t r = 0; r < rows; ++r) {
      const hsize_t start[2] = {time.at(r), 0};
      if (H5Sselect_hyperslab(file_space.get(), H5S_SELECT_SET, start, nullptr, count, nullptr) < 0 ||
          H5Dread(ds.get(), H5T_NATIVE_DOUBLE, mem_space.get(), file_space.get(), H5P_DEFAULT, row.data()) < 0) {
        return resx::core::Slice{.status = resx::core::Status::DataUnavailable};
      }
      for (std::size_t c = 0; c < cols; ++c) {
        out(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c];
      }
    }
  } else {
    // Column-wise reads: the full time series of each selected site.
    std::vector<double> column(n_time);
    const hsize_t count[2] = {n_time, 1};
    H5Handle mem_space(H5Screate_simple(2, count, nullptr), H5Sclose);
    for (std::size_t c = 0; c < cols; ++c) {
      const hsize_t start[2] = {0, sites.at(c)};
      if (H5Sselect_hyperslab(file_space.get(), H5S_SELECT_SET, start, nullptr, count, nullptr) < 0 ||
          H5Dread(ds.get(), H5T_NATIVE_DOUBLE, mem_space.get(), file_space.get(), H5P_DEFAULT, column.data()) < 0) {
        return resx::core::Slice{.status = resx::core::Status::DataUnavailable};
      }
      for (std::size_t r = 0; r < rows; ++r) {
        out(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = column[time.at(r)];
      }
    }
  }

  if (it->second != 1.0) {
    out /= it->second;
  }
  return resx::core::Slice{.values = std::move(out)};
}

}  // namespace resx::storage
