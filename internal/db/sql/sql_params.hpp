#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dbtarget::db::sql {

/*
  Parameter / cell value abstraction.

  Mirrors the storage classes the engine actually keeps:
    NULL, INTEGER, REAL, TEXT

  Binding is positional (?1 ?2 ...) in declaration order.
*/

using Param = std::variant<std::nullptr_t, std::int64_t, double, std::string>;

using Params = std::vector<Param>;

inline std::string_view TypeName(const Param& value) {
  switch (value.index()) {
    case 0:
      return "null";
    case 1:
      return "integer";
    case 2:
      return "real";
    default:
      return "text";
  }
}

} // namespace dbtarget::db::sql
