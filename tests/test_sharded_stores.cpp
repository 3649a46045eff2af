/**
 * @file test_sharded_stores.cpp
 * @brief Spatial and temporal shard composition, slicing and file discovery tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "resx/storage/discovery.hpp"
#include "resx/storage/memory_store.hpp"
#include "resx/storage/multi_file_store.hpp"
#include "resx/storage/multi_year_store.hpp"

namespace {

using resx::core::Column;
using resx::core::ColumnKind;

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

// `sites` sites at latitudes lat0, lat0 + 1, ...; value(t, s) = base + 10 t + s.
std::unique_ptr<resx::core::IResourceStore> shard(const std::string& name, double lat0, int sites,
                                                  const std::vector<std::string>& stamps, double base,
                                                  const std::string& state = "CO") {
  Column lat{.name = "latitude", .kind = ColumnKind::Numeric};
  Column lon{.name = "longitude", .kind = ColumnKind::Numeric};
  Column st{.name = "state", .kind = ColumnKind::Text};
  for (int s = 0; s < sites; ++s) {
    lat.numbers.push_back(lat0 + s);
    lon.numbers.push_back(-100.0);
    st.strings.push_back(state);
  }
  auto meta = resx::core::SiteTable::FromColumns({lat, lon, st});
  auto axis = resx::core::TimeAxis::FromStrings(stamps);
  if (!meta.has_value() || !axis.has_value()) {
    return {};
  }
  Eigen::MatrixXd values(static_cast<Eigen::Index>(stamps.size()), sites);
  for (Eigen::Index t = 0; t < values.rows(); ++t) {
    for (Eigen::Index s = 0; s < values.cols(); ++s) {
      values(t, s) = base + 10.0 * static_cast<double>(t) + static_cast<double>(s);
    }
  }
  return resx::storage::MemoryResourceStore::Create(
      {.source_name = name, .meta = std::move(*meta), .time_index = std::move(*axis), .datasets = {{"ghi", values}}});
}

const std::vector<std::string> kDay2012{"2012-06-01T00:00", "2012-06-01T01:00"};
const std::vector<std::string> kDay2013{"2013-06-01T00:00", "2013-06-01T01:00", "2013-06-01T02:00"};

bool touch(const std::filesystem::path& p) {
  std::ofstream out(p);
  return static_cast<bool>(out);
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using resx::core::Selection;
  using resx::core::Status;
  using resx::storage::MultiFileResourceStore;
  using resx::storage::MultiYearResourceStore;
  using resx::storage::YearShard;

  // Spatial shards: 2 + 3 sites.
  std::vector<std::unique_ptr<resx::core::IResourceStore>> parts;
  parts.push_back(shard("conus_a.h5", 30.0, 2, kDay2012, 0.0));
  parts.push_back(shard("conus_b.h5", 40.0, 3, kDay2012, 1000.0, "WY"));
  auto spatial = MultiFileResourceStore::Compose(std::move(parts));
  if (spatial.status != Status::Ok || spatial.store->meta().size() != 5 || spatial.store->shard_count() != 2 ||
      spatial.store->offset(1) != 2) {
    spdlog::error("spatial composition failed");
    return 1;
  }
  const auto& mf = *spatial.store;
  const auto coords = mf.meta().lat_lon();
  if (!coords.has_value() || !approx((*coords)(3, 0), 41.0, 1e-12) ||
      mf.meta().ids_where("state", "WY") != std::vector<std::size_t>{2, 3, 4}) {
    spdlog::error("spatial site table not concatenated in shard order");
    return 2;
  }
  const auto cross = mf.read("ghi", Selection::All(), Selection::Of({4, 0, 2}));
  if (cross.status != Status::Ok || cross.values.cols() != 3 || !approx(cross.values(1, 0), 1012.0, 1e-12) ||
      !approx(cross.values(1, 1), 10.0, 1e-12) || !approx(cross.values(0, 2), 1000.0, 1e-12)) {
    spdlog::error("cross-shard read failed");
    return 3;
  }
  const auto whole = mf.read("ghi", Selection::One(1), Selection::All());
  if (whole.status != Status::Ok || whole.values.cols() != 5 || !approx(whole.values(0, 4), 1012.0, 1e-12)) {
    spdlog::error("full-width read failed");
    return 4;
  }
  if (mf.read("ghi", Selection::All(), Selection::One(5)).status != Status::NotFound ||
      mf.read("dni", Selection::All(), Selection::All()).status != Status::NotFound) {
    spdlog::error("out-of-range spatial read accepted");
    return 5;
  }

  std::vector<std::unique_ptr<resx::core::IResourceStore>> skewed;
  skewed.push_back(shard("conus_a.h5", 30.0, 2, kDay2012, 0.0));
  skewed.push_back(shard("conus_b.h5", 40.0, 3, kDay2013, 0.0));
  if (MultiFileResourceStore::Compose(std::move(skewed)).status != Status::ShardInconsistency ||
      MultiFileResourceStore::Compose({}).status != Status::InvalidInput) {
    spdlog::error("mismatched spatial shards accepted");
    return 6;
  }

  // Temporal shards, supplied out of order.
  std::vector<YearShard> years;
  years.push_back(YearShard{.year = 2013, .store = shard("nsrdb_2013.h5", 30.0, 2, kDay2013, 500.0)});
  years.push_back(YearShard{.year = 2012, .store = shard("nsrdb_2012.h5", 30.0, 2, kDay2012, 0.0)});
  auto temporal = MultiYearResourceStore::Compose(std::move(years));
  if (temporal.status != Status::Ok || temporal.store->time_index().size() != 5 ||
      temporal.store->years() != std::vector<int>{2012, 2013} || temporal.store->source_name() != "nsrdb_2012.h5") {
    spdlog::error("temporal composition failed");
    return 7;
  }
  const auto& my = *temporal.store;
  const auto span = my.read("ghi", Selection::Of({1, 2, 4}), Selection::One(1));
  if (span.status != Status::Ok || !approx(span.values(0, 0), 11.0, 1e-12) || !approx(span.values(1, 0), 501.0, 1e-12) ||
      !approx(span.values(2, 0), 521.0, 1e-12)) {
    spdlog::error("cross-year read failed");
    return 8;
  }
  const auto pos = my.positions_for({2013});
  if (!pos.has_value() || *pos != std::vector<std::size_t>{2, 3, 4} || my.positions_for({2014}).has_value() ||
      my.shard(2013) == nullptr || my.shard(2014) != nullptr) {
    spdlog::error("year positions failed");
    return 9;
  }

  std::vector<YearShard> moved;
  moved.push_back(YearShard{.year = 2012, .store = shard("nsrdb_2012.h5", 30.0, 2, kDay2012, 0.0)});
  moved.push_back(YearShard{.year = 2013, .store = shard("nsrdb_2013.h5", 31.0, 2, kDay2013, 0.0)});
  std::vector<YearShard> shrunk;
  shrunk.push_back(YearShard{.year = 2012, .store = shard("nsrdb_2012.h5", 30.0, 2, kDay2012, 0.0)});
  shrunk.push_back(YearShard{.year = 2013, .store = shard("nsrdb_2013.h5", 30.0, 3, kDay2013, 0.0)});
  std::vector<YearShard> twice;
  twice.push_back(YearShard{.year = 2012, .store = shard("nsrdb_2012.h5", 30.0, 2, kDay2012, 0.0)});
  twice.push_back(YearShard{.year = 2012, .store = shard("nsrdb_2012b.h5", 30.0, 2, kDay2012, 0.0)});
  if (MultiYearResourceStore::Compose(std::move(moved)).status != Status::ShardInconsistency ||
      MultiYearResourceStore::Compose(std::move(shrunk)).status != Status::ShardInconsistency ||
      MultiYearResourceStore::Compose(std::move(twice)).status != Status::ShardInconsistency) {
    spdlog::error("inconsistent yearly shards accepted");
    return 10;
  }

  const auto dir = fs::temp_directory_path() / "resx_discovery_test";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  for (const char* name : {"nsrdb_2013.h5", "nsrdb_2012.h5", "nsrdb_conus.h5", "wtk_2012.h5", "notes.txt"}) {
    if (!touch(dir / name)) {
      spdlog::error("failed to create {}", name);
      return 11;
    }
  }
  const auto all = resx::storage::discover_shards(dir);
  if (all.status != Status::Ok || all.files.size() != 4 || all.files.front().filename() != "nsrdb_2012.h5") {
    spdlog::error("directory discovery failed");
    return 12;
  }
  const auto pattern = resx::storage::discover_shards(dir / "nsrdb_*.h5");
  if (pattern.status != Status::Ok || pattern.files.size() != 3) {
    spdlog::error("pattern discovery failed");
    return 13;
  }
  const auto yearly = resx::storage::discover_years(dir / "nsrdb_*.h5");
  if (yearly.status != Status::Ok || yearly.files.size() != 2 || yearly.files[0].year != 2012 ||
      yearly.files[1].file.filename() != "nsrdb_2013.h5") {
    spdlog::error("year discovery failed");
    return 14;
  }
  if (resx::storage::discover_years(dir / "nsrdb_*.h5", {2013}).files.size() != 1 ||
      resx::storage::discover_years(dir / "nsrdb_*.h5", {2015}).status != Status::NotFound ||
      resx::storage::discover_years(dir).status != Status::InvalidInput ||
      resx::storage::discover_shards(dir / "nothing_*.h5").status != Status::NotFound ||
      resx::storage::discover_shards(dir / "missing").status != Status::InvalidInput) {
    spdlog::error("discovery failures not reported");
    return 15;
  }

  fs::remove_all(dir, ec);
  return 0;
}
