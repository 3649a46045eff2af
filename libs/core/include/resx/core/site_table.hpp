/**
 * @file site_table.hpp
 * @brief Immutable site metadata table (one row per modeled site).
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "resx/core/types.hpp"

namespace resx::core {

/**
 * @brief Storage kind of a metadata column.
 */
enum class ColumnKind : std::uint8_t { Numeric, Text };

/**
 * @brief One named metadata column. Only the vector matching `kind` is populated.
 */
struct Column {
  std::string name{};
  ColumnKind kind{ColumnKind::Numeric};
  std::vector<double> numbers{};
  std::vector<std::string> strings{};

  [[nodiscard]] std::size_t size() const noexcept { return kind == ColumnKind::Numeric ? numbers.size() : strings.size(); }
  /**
   * @brief Text rendering of one cell (numbers use the shortest round-trip form).
   */
  [[nodiscard]] std::string cell_text(std::size_t row) const;
};

/**
 * @brief Column-ordered site table. Row position is the site id.
 */
class SiteTable {
 public:
  SiteTable() = default;

  /**
   * @brief Build a table from columns of equal length.
   * @return Empty optional when column lengths differ or names repeat.
   */
  static std::optional<SiteTable> FromColumns(std::vector<Column> columns);

  [[nodiscard]] std::size_t size() const noexcept { return rows_; }
  [[nodiscard]] bool empty() const noexcept { return rows_ == 0; }
  [[nodiscard]] bool contains(SiteId id) const noexcept { return id < rows_; }
  [[nodiscard]] const std::vector<Column>& columns() const noexcept { return columns_; }

  [[nodiscard]] const Column* column(std::string_view name) const noexcept;
  [[nodiscard]] bool has_column(std::string_view name) const noexcept { return column(name) != nullptr; }

  /**
   * @brief First column whose name starts (case-insensitively) with `prefix`.
   */
  [[nodiscard]] const Column* column_with_prefix(std::string_view prefix) const noexcept;

  /**
   * @brief Ids whose `column` cell equals `value`, ascending. Missing column yields empty.
   */
  [[nodiscard]] std::vector<SiteId> ids_where(std::string_view column, std::string_view value) const;

  /**
   * @brief Distinct values of a column in first-seen order, or nullopt if the column is absent.
   */
  [[nodiscard]] std::optional<std::vector<std::string>> distinct(std::string_view column) const;

  /**
   * @brief (lat, lon) pairs from the first "lat*" and "lon*" numeric columns.
   */
  [[nodiscard]] std::optional<Eigen::MatrixX2d> lat_lon() const;

  /**
   * @brief One-row table holding the record of `id`.
   */
  [[nodiscard]] std::optional<SiteTable> row(SiteId id) const;

  /**
   * @brief Rows of `other` appended below this table; schemas must match.
   */
  [[nodiscard]] std::optional<SiteTable> concat(const SiteTable& other) const;

 private:
  SiteTable(std::vector<Column> columns, std::size_t rows) : columns_(std::move(columns)), rows_(rows) {}

  std::vector<Column> columns_{};
  std::size_t rows_{};
};

}  // namespace resx::core
