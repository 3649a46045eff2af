/**
 * @file test_bundle_export.cpp
 * @brief Site bundle assembly, multiplicity and tabular export tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "resx/extraction/bundle_exporter.hpp"
#include "resx/storage/memory_store.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

std::unique_ptr<resx::storage::MemoryResourceStore> make_store(bool with_gid) {
  using resx::core::Column;
  using resx::core::ColumnKind;
  std::vector<Column> columns;
  if (with_gid) {
    columns.push_back(Column{.name = "gid", .kind = ColumnKind::Numeric, .numbers = {1000.0, 1001.0}});
  }
  columns.push_back(Column{.name = "latitude", .kind = ColumnKind::Numeric, .numbers = {40.0, 41.0}});
  columns.push_back(Column{.name = "longitude", .kind = ColumnKind::Numeric, .numbers = {-105.0, -104.0}});
  columns.push_back(Column{.name = "timezone", .kind = ColumnKind::Numeric, .numbers = {-7.0, -7.0}});
  columns.push_back(Column{.name = "ELEVATION", .kind = ColumnKind::Numeric, .numbers = {1655.0, 1600.5}});
  columns.push_back(Column{.name = "state", .kind = ColumnKind::Text, .strings = {"CO", "WY"}});
  auto meta = resx::core::SiteTable::FromColumns(std::move(columns));
  auto axis = resx::core::TimeAxis::FromStrings({"2012-01-01T00:00", "2012-01-01T00:30", "2012-01-01T01:00"});
  if (!meta.has_value() || !axis.has_value()) {
    return {};
  }
  Eigen::MatrixXd ghi(3, 2);
  ghi << 0.0, 0.5, 12.25, 13.75, 101.125, 99.0;
  Eigen::MatrixXd temperature(3, 2);
  temperature << -3.5, -4.0, -3.25, -4.5, -2.0, -1.0 / 3.0;
  return resx::storage::MemoryResourceStore::Create({.source_name = "bundle_test.h5",
                                                     .meta = std::move(*meta),
                                                     .time_index = std::move(*axis),
                                                     .datasets = {{"ghi", ghi}, {"temperature", temperature}}});
}

std::vector<std::string> read_lines(const std::filesystem::path& p) {
  std::vector<std::string> lines;
  std::ifstream in(p);
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

std::vector<std::string> split(const std::string& line) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (std::size_t comma = line.find(','); comma != std::string::npos; comma = line.find(',', start)) {
    out.push_back(line.substr(start, comma - start));
    start = comma + 1;
  }
  out.push_back(line.substr(start));
  return out;
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using resx::core::Missing;
  using resx::core::Status;
  using resx::extraction::BundleExporter;
  using resx::extraction::SiteBundle;
  using resx::extraction::VariableSet;

  const auto store = make_store(false);
  if (!store) {
    spdlog::error("store setup failed");
    return 1;
  }
  const BundleExporter exporter(*store);
  const VariableSet vars{.variables = {"ghi", "temperature"}};

  const auto built = exporter.build_bundle(1, vars);
  if (built.status != Status::Ok || built.bundle.name != "SAM-1" || built.bundle.values.rows() != 3 ||
      built.bundle.values.cols() != 2 || built.bundle.site_meta.size() != 1 ||
      !approx(built.bundle.values(2, 1), -1.0 / 3.0, 0.0)) {
    spdlog::error("bundle assembly failed");
    return 2;
  }

  const auto dir = fs::temp_directory_path() / "resx_bundle_export_test";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);

  const auto written = BundleExporter::export_bundle(built.bundle, dir);
  if (written.status != Status::Ok || written.file != dir / "SAM-1.csv" || !fs::exists(written.file)) {
    spdlog::error("directory export not named from the bundle");
    return 3;
  }
  const auto lines = read_lines(written.file);
  if (lines.size() != 2 + 1 + 3) {
    spdlog::error("expected 6 lines, found {}", lines.size());
    return 4;
  }
  if (lines[0] != "Location ID,Latitude,Longitude,Time Zone,Elevation,State" || lines[1] != "1,41,-104,-7,1600.5,WY" ||
      lines[2] != "Year,Month,Day,Hour,Minute,ghi,temperature") {
    spdlog::error("header rows wrong: '{}' / '{}' / '{}'", lines[0], lines[1], lines[2]);
    return 5;
  }

  // Data rows re-parse to the bundle's values in time-axis order.
  for (std::size_t t = 0; t < 3; ++t) {
    const auto cells = split(lines[3 + t]);
    if (cells.size() != 7 || cells[0] != "2012" || cells[1] != "1" || cells[2] != "1") {
      spdlog::error("row {} malformed: {}", t, lines[3 + t]);
      return 6;
    }
    const auto row = static_cast<Eigen::Index>(t);
    if (std::stoi(cells[3]) * 60 + std::stoi(cells[4]) != static_cast<int>(t) * 30 ||
        std::stod(cells[5]) != built.bundle.values(row, 0) || std::stod(cells[6]) != built.bundle.values(row, 1)) {
      spdlog::error("row {} values do not round-trip: {}", t, lines[3 + t]);
      return 7;
    }
  }

  const auto named = BundleExporter::export_bundle(built.bundle, dir / "custom.csv");
  if (named.status != Status::Ok || read_lines(dir / "custom.csv").size() != 6) {
    spdlog::error("explicit file export failed");
    return 8;
  }
  if (BundleExporter::export_bundle(built.bundle, dir / "absent").status != Status::InvalidInput ||
      BundleExporter::export_bundle(built.bundle, dir / "absent" / "x.csv").status != Status::InvalidInput) {
    spdlog::error("missing destination accepted");
    return 9;
  }

  const auto unknown = exporter.build_bundle(0, VariableSet{.variables = {"ghi", "dni"}});
  const auto out_of_range = exporter.build_bundle(2, vars);
  if (unknown.status != Status::NotFound || unknown.missing != Missing::Variable ||
      out_of_range.status != Status::NotFound || out_of_range.missing != Missing::Site ||
      exporter.build_bundle(0, VariableSet{}).status != Status::InvalidInput) {
    spdlog::error("bundle failures not distinguished");
    return 10;
  }

  const auto lenient = exporter.build_bundle(0, resx::extraction::default_variables(resx::core::Domain::Solar));
  if (lenient.status != Status::Ok || lenient.bundle.variables != std::vector<std::string>{"ghi"}) {
    spdlog::error("domain default set did not drop absent variables");
    return 11;
  }
  if (exporter.build_bundle(0, resx::extraction::default_variables(resx::core::Domain::Wave)).missing !=
      Missing::Variable) {
    spdlog::error("domain set with no available variable accepted");
    return 12;
  }

  const auto single = exporter.build_bundles({0}, vars);
  const auto pair = exporter.build_bundles({1, 0}, vars, dir);
  if (single.status != Status::Ok || !std::holds_alternative<SiteBundle>(single.bundles) ||
      pair.status != Status::Ok || !std::holds_alternative<std::vector<SiteBundle>>(pair.bundles)) {
    spdlog::error("bundle multiplicity wrong");
    return 13;
  }
  const auto& both = std::get<std::vector<SiteBundle>>(pair.bundles);
  if (both.size() != 2 || both[0].site_id != 1 || both[1].site_id != 0 || !fs::exists(dir / "SAM-0.csv")) {
    spdlog::error("batch order or export failed");
    return 14;
  }
  if (exporter.build_bundles({0, 7}, vars).status != Status::NotFound) {
    spdlog::error("batch did not stop at the failing site");
    return 15;
  }

  const auto wind = exporter.build_bundle(0, resx::extraction::wind_variables(100));
  if (wind.status != Status::NotFound || resx::extraction::wind_variables(80).variables.front() != "windspeed_80m" ||
      resx::extraction::bundle_name(resx::extraction::wind_variables(80).bundle_prefix, 5) != "SAM_80m-5") {
    spdlog::error("wind variable set wrong");
    return 16;
  }

  const auto gid_store = make_store(true);
  const auto gid_bundle = BundleExporter(*gid_store).build_bundle(1, vars);
  const auto gid_file = BundleExporter::export_bundle(gid_bundle.bundle, dir);
  const auto gid_lines = gid_file.status == Status::Ok ? read_lines(gid_file.file) : std::vector<std::string>{};
  if (gid_lines.size() != 6 || gid_lines[0] != "Location ID,Latitude,Longitude,Time Zone,Elevation,State" ||
      gid_lines[1] != "1001,41,-104,-7,1600.5,WY") {
    spdlog::error("gid column not mapped to Location ID");
    return 17;
  }

  fs::remove_all(dir, ec);
  return 0;
}
