#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace jwlmerge::db::sql {

/*
  Column value abstraction.

  Mirrors the sqlite storage classes:
    NULL, INTEGER, REAL, TEXT, BLOB

  Rows are ordered tuples of these, in the column order of the
  entity descriptor that produced them.
*/

using Blob = std::vector<std::uint8_t>;

using Value = std::variant<
    std::nullptr_t,
    std::int64_t,
    double,
    std::string,
    Blob
>;

using Values = std::vector<Value>;

inline bool IsNull(const Value& v) {
  return std::holds_alternative<std::nullptr_t>(v);
}

// Renders a value for log output. Blobs are summarized by size.
std::string ToDebugString(const Value& v);

// "Col=val, Col=val" for the given parallel column/value lists.
std::string DescribeRow(const std::vector<std::string>& columns, const Values& values);

}
