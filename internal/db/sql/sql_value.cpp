#include "internal/db/sql/sql_value.hpp"

#include <sstream>

namespace jwlmerge::db::sql {

std::string ToDebugString(const Value& v) {
  switch (v.index()) {
    case 0:
      return "NULL";
    case 1:
      return std::to_string(std::get<std::int64_t>(v));
    case 2: {
      std::ostringstream out;
      out << std::get<double>(v);
      return out.str();
    }
    case 3:
      return "'" + std::get<std::string>(v) + "'";
    default:
      return "<blob " + std::to_string(std::get<Blob>(v).size()) + " bytes>";
  }
}

std::string DescribeRow(const std::vector<std::string>& columns, const Values& values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < columns.size() && i < values.size(); ++i) {
    if (i != 0) {
      out << ", ";
    }
    out << columns[i] << '=' << ToDebugString(values[i]);
  }
  return out.str();
}

} // namespace jwlmerge::db::sql
