/**
 * @file site_table.cpp
 * @brief Site metadata table implementation.
 * @author Watosn
 */

#include "resx/core/site_table.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include <fmt/format.h>

namespace resx::core {
namespace {

bool starts_with_icase(std::string_view text, std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string Column::cell_text(std::size_t row) const {
  if (kind == ColumnKind::Text) {
    return strings[row];
  }
  return fmt::format("{}", numbers[row]);
}

std::optional<SiteTable> SiteTable::FromColumns(std::vector<Column> columns) {
  if (columns.empty()) {
    return SiteTable{};
  }
  const std::size_t rows = columns.front().size();
  std::unordered_set<std::string> names;
  for (const auto& c : columns) {
    if (c.size() != rows || !names.insert(c.name).second) {
      return std::nullopt;
    }
  }
  return SiteTable(std::move(columns), rows);
}

const Column* SiteTable::column(std::string_view name) const noexcept {
  for (const auto& c : columns_) {
    if (c.name == name) {
      return &c;
    }
  }
  return nullptr;
}

const Column* SiteTable::column_with_prefix(std::string_view prefix) const noexcept {
  for (const auto& c : columns_) {
    if (starts_with_icase(c.name, prefix)) {
      return &c;
    }
  }
  return nullptr;
}

std::vector<SiteId> SiteTable::ids_where(std::string_view column_name, std::string_view value) const {
  std::vector<SiteId> ids;
  const Column* c = column(column_name);
  if (c == nullptr) {
    return ids;
  }
  for (std::size_t i = 0; i < rows_; ++i) {
    if (c->kind == ColumnKind::Text ? c->strings[i] == value : c->cell_text(i) == value) {
      ids.push_back(i);
    }
  }
  return ids;
}

std::optional<std::vector<std::string>> SiteTable::distinct(std::string_view column_name) const {
  const Column* c = column(column_name);
  if (c == nullptr) {
    return std::nullopt;
  }
  std::vector<std::string> values;
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < rows_; ++i) {
    auto text = c->cell_text(i);
    if (seen.insert(text).second) {
      values.push_back(std::move(text));
    }
  }
  return values;
}

std::optional<Eigen::MatrixX2d> SiteTable::lat_lon() const {
  const Column* lat = column_with_prefix("lat");
  const Column* lon = column_with_prefix("lon");
  if (lat == nullptr || lon == nullptr || lat->kind != ColumnKind::Numeric || lon->kind != ColumnKind::Numeric) {
    return std::nullopt;
  }
  Eigen::MatrixX2d out(static_cast<Eigen::Index>(rows_), 2);
  for (std::size_t i = 0; i < rows_; ++i) {
    out(static_cast<Eigen::Index>(i), 0) = lat->numbers[i];
    out(static_cast<Eigen::Index>(i), 1) = lon->numbers[i];
  }
  return out;
}

std::optional<SiteTable> SiteTable::row(SiteId id) const {
  if (!contains(id)) {
    return std::nullopt;
  }
  std::vector<Column> out;
  out.reserve(columns_.size());
  for (const auto& c : columns_) {
    Column one{.name = c.name, .kind = c.kind};
    if (c.kind == ColumnKind::Numeric) {
      one.numbers.push_back(c.numbers[id]);
    } else {
      one.strings.push_back(c.strings[id]);
    }
    out.push_back(std::move(one));
  }
  return SiteTable(std::move(out), 1);
}

std::optional<SiteTable> SiteTable::concat(const SiteTable& other) const {
  if (columns_.empty()) {
    return other;
  }
  if (other.columns_.size() != columns_.size()) {
    return std::nullopt;
  }
  std::vector<Column> out = columns_;
  for (std::size_t k = 0; k < out.size(); ++k) {
    const Column& rhs = other.columns_[k];
    if (rhs.name != out[k].name || rhs.kind != out[k].kind) {
      return std::nullopt;
    }
    out[k].numbers.insert(out[k].numbers.end(), rhs.numbers.begin(), rhs.numbers.end());
    out[k].strings.insert(out[k].strings.end(), rhs.strings.begin(), rhs.strings.end());
  }
  return SiteTable(std::move(out), rows_ + other.rows_);
}

}  // namespace resx::core
