/**
 * @file bundle_exporter.cpp
 * @brief Bundle assembly and tabular export.
 * @author Watosn
 */

#include "resx/extraction/bundle_exporter.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace resx::extraction {
namespace {

using resx::core::Missing;
using resx::core::Selection;
using resx::core::SiteId;
using resx::core::Status;

constexpr std::string_view kExtension = ".csv";
constexpr std::string_view kTimeColumns = "Year,Month,Day,Hour,Minute";

std::string csv_field(const std::string& text) {
  if (text.find_first_of(",\"\n") == std::string::npos) {
    return text;
  }
  std::string out = "\"";
  for (const char c : text) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
  return out;
}

std::string header_name(const std::string& column) {
  if (column == "timezone") {
    return "Time Zone";
  }
  std::string out = column;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  if (!out.empty()) {
    out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
  }
  return out;
}

// Two header rows: attribute names, then the site's values.
std::pair<std::string, std::string> site_header(const SiteBundle& bundle) {
  const auto& meta = bundle.site_meta;
  const auto* gid = meta.column("gid");
  std::vector<std::string> names{"Location ID"};
  std::vector<std::string> values{gid != nullptr && !meta.empty() ? gid->cell_text(0)
                                                                  : fmt::format("{}", bundle.site_id)};
  for (const auto& column : meta.columns()) {
    if (column.name == "gid" || meta.empty()) {
      continue;
    }
    names.push_back(csv_field(header_name(column.name)));
    values.push_back(csv_field(column.cell_text(0)));
  }
  return {fmt::format("{}", fmt::join(names, ",")), fmt::format("{}", fmt::join(values, ","))};
}

bool write_data_rows(const SiteBundle& bundle, const std::filesystem::path& file) {
  std::ofstream out(file, std::ios::trunc);
  if (!out) {
    return false;
  }
  out << kTimeColumns;
  for (const auto& v : bundle.variables) {
    out << ',' << csv_field(v);
  }
  out << '\n';
  for (std::size_t t = 0; t < bundle.time_index.size(); ++t) {
    const auto c = resx::core::to_civil(bundle.time_index[t]);
    out << fmt::format("{},{},{},{},{}", c.year, c.month, c.day, c.hour, c.minute);
    for (Eigen::Index v = 0; v < bundle.values.cols(); ++v) {
      out << ',' << fmt::format("{}", bundle.values(static_cast<Eigen::Index>(t), v));
    }
    out << '\n';
  }
  return static_cast<bool>(out);
}

bool prepend_header(const SiteBundle& bundle, const std::filesystem::path& file) {
  std::string body;
  {
    std::ifstream in(file);
    if (!in) {
      return false;
    }
    body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  const auto [names, values] = site_header(bundle);
  std::ofstream out(file, std::ios::trunc);
  if (!out) {
    return false;
  }
  out << names << '\n' << values << '\n' << body;
  return static_cast<bool>(out);
}

}  // namespace

BundleResult BundleExporter::build_bundle(SiteId site_id, const VariableSet& variables) const {
  if (!store_.meta().contains(site_id)) {
    return BundleResult{.status = Status::NotFound, .missing = Missing::Site};
  }

  std::vector<std::string> names;
  for (const auto& v : variables.variables) {
    if (store_.has_dataset(v)) {
      names.push_back(v);
    } else if (variables.strict) {
      spdlog::error("{}: variable {} not available for bundle", store_.source_name(), v);
      return BundleResult{.status = Status::NotFound, .missing = Missing::Variable};
    }
  }
  if (names.empty()) {
    spdlog::error("{}: none of the requested bundle variables are available", store_.source_name());
    return BundleResult{.status = variables.variables.empty() ? Status::InvalidInput : Status::NotFound,
                        .missing = variables.variables.empty() ? Missing::None : Missing::Variable};
  }

  const auto steps = static_cast<Eigen::Index>(store_.time_index().size());
  Eigen::MatrixXd values(steps, static_cast<Eigen::Index>(names.size()));
  for (std::size_t k = 0; k < names.size(); ++k) {
    const auto slice = store_.read(names[k], Selection::All(), Selection::One(site_id));
    if (slice.status != Status::Ok) {
      return BundleResult{.status = slice.status};
    }
    values.col(static_cast<Eigen::Index>(k)) = slice.values.col(0);
  }

  auto record = store_.meta().row(site_id);
  return BundleResult{.bundle = SiteBundle{.name = bundle_name(variables.bundle_prefix, site_id),
                                           .site_id = site_id,
                                           .time_index = store_.time_index().stamps(),
                                           .variables = std::move(names),
                                           .values = std::move(values),
                                           .site_meta = record.has_value() ? std::move(*record)
                                                                           : resx::core::SiteTable{}}};
}

BundleBatch BundleExporter::build_bundles(const std::vector<SiteId>& site_ids, const VariableSet& variables,
                                          const std::optional<std::filesystem::path>& destination) const {
  std::vector<SiteBundle> bundles;
  bundles.reserve(site_ids.size());
  for (const SiteId id : site_ids) {
    auto built = build_bundle(id, variables);
    if (built.status != Status::Ok) {
      spdlog::error("bundle for site {} failed: {}", id, resx::core::to_string(built.status));
      return BundleBatch{.status = built.status, .missing = built.missing};
    }
    if (destination.has_value()) {
      const auto written = export_bundle(built.bundle, *destination);
      if (written.status != Status::Ok) {
        return BundleBatch{.status = written.status};
      }
    }
    bundles.push_back(std::move(built.bundle));
  }
  if (bundles.size() == 1) {
    return BundleBatch{.bundles = std::move(bundles.front())};
  }
  return BundleBatch{.bundles = std::move(bundles)};
}

ExportResult BundleExporter::export_bundle(const SiteBundle& bundle, const std::filesystem::path& destination) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path file = destination;
  if (destination.extension().string() == kExtension) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
      spdlog::error("export directory does not exist: {}", parent.string());
      return ExportResult{.status = Status::InvalidInput};
    }
  } else {
    if (!fs::is_directory(destination, ec)) {
      spdlog::error("export directory does not exist: {}", destination.string());
      return ExportResult{.status = Status::InvalidInput};
    }
    file = destination / fmt::format("{}{}", bundle.name, kExtension);
  }

  if (!write_data_rows(bundle, file) || !prepend_header(bundle, file)) {
    spdlog::error("failed to write {}", file.string());
    return ExportResult{.file = file, .status = Status::DataUnavailable};
  }
  spdlog::info("wrote {} to {}", bundle.name, file.string());
  return ExportResult{.file = file};
}

}  // namespace resx::extraction
