#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/db/sql/sql_params.hpp"

namespace dbtarget::db::sql {

/*
  Materialized row: ordered (column, value) pairs.

  Used both for rows read back from Query() and for rows the codec builds
  before insertion, so driver types never leak into codec or target logic.
*/
class Row {
 public:
  Row() = default;

  void Set(std::string column, Param value) {
    for (auto& [name, existing] : cells_) {
      if (name == column) {
        existing = std::move(value);
        return;
      }
    }
    cells_.emplace_back(std::move(column), std::move(value));
  }

  // nullptr when the column is absent
  const Param* Find(std::string_view column) const {
    for (const auto& [name, value] : cells_) {
      if (name == column) return &value;
    }
    return nullptr;
  }

  bool IsNull(std::string_view column) const {
    const auto* value = Find(column);
    return value == nullptr || std::holds_alternative<std::nullptr_t>(*value);
  }

  std::size_t Size() const {
    return cells_.size();
  }

  const std::vector<std::pair<std::string, Param>>& Cells() const {
    return cells_;
  }

  // values in column order, ready for positional binding
  Params Values() const {
    Params out;
    out.reserve(cells_.size());
    for (const auto& cell : cells_) out.push_back(cell.second);
    return out;
  }

 private:
  std::vector<std::pair<std::string, Param>> cells_;
};

} // namespace dbtarget::db::sql
