#include "internal/merge/duplicate_key.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace jwlmerge::merge {

using db::sql::IsNull;
using db::sql::Values;
using schema::EntityDescriptor;
using schema::EntityKind;

namespace {

bool IsDocumentWithTrack(const db::sql::Value& type) {
  if (const auto* i = std::get_if<std::int64_t>(&type)) {
    return *i == schema::kLocationTypeDocumentWithTrack;
  }
  if (const auto* d = std::get_if<double>(&type)) {
    return *d == static_cast<double>(schema::kLocationTypeDocumentWithTrack);
  }
  return false;
}

KeyColumns LocationKey(const EntityDescriptor& descriptor, const Values& record) {
  const auto type_index     = descriptor.ColumnIndex("Type");
  const auto document_index = descriptor.ColumnIndex("DocumentId");
  if (!type_index || !document_index) {
    throw std::logic_error("Location descriptor lacks Type/DocumentId");
  }

  if (IsDocumentWithTrack(record.at(*type_index))) {
    return ResolveColumns(descriptor, {"KeySymbol", "IssueTagNumber", "MepsLanguage", "DocumentId", "Track", "Type"});
  }
  if (!IsNull(record.at(*document_index))) {
    return ResolveColumns(descriptor, {"BookNumber", "ChapterNumber", "KeySymbol", "MepsLanguage", "Type", "DocumentId"});
  }
  return ResolveColumns(descriptor, {"BookNumber", "ChapterNumber", "KeySymbol", "MepsLanguage", "Type"});
}

} // namespace

KeyColumns ResolveColumns(const EntityDescriptor& descriptor, const std::vector<std::string>& names) {
  KeyColumns key;
  key.reserve(names.size());
  for (const auto& name : names) {
    auto index = descriptor.ColumnIndex(name);
    if (!index) {
      throw std::logic_error(descriptor.table + " has no column " + name);
    }
    key.push_back(*index);
  }
  return key;
}

KeyColumns DuplicateKeyColumns(const EntityDescriptor& descriptor, const Values& record) {
  if (descriptor.kind == EntityKind::Location) {
    return LocationKey(descriptor, record);
  }

  KeyColumns key(descriptor.columns.size());
  for (std::size_t i = 0; i < key.size(); ++i) key[i] = i;
  return key;
}

KeyPredicate BuildKeyPredicate(const EntityDescriptor& descriptor, const KeyColumns& key, const Values& record) {
  KeyPredicate predicate;
  for (std::size_t i = 0; i < key.size(); ++i) {
    const auto& column = descriptor.columns.at(key[i]);
    const auto& value  = record.at(key[i]);
    if (i != 0) predicate.where += " AND ";
    if (IsNull(value)) {
      predicate.where += column + " IS NULL";
    } else {
      predicate.where += column + " = ?";
      predicate.params.push_back(value);
    }
  }
  return predicate;
}

std::vector<std::string> FailedConstraintColumns(const std::string& message) {
  static constexpr std::string_view kMarker = "constraint failed: ";

  std::vector<std::string> columns;
  const auto               at = message.find(kMarker);
  if (at == std::string::npos) return columns;

  std::size_t start = at + kMarker.size();
  while (start < message.size()) {
    std::size_t end = message.find(',', start);
    if (end == std::string::npos) end = message.size();

    auto part  = message.substr(start, end - start);
    auto first = part.find_first_not_of(' ');
    auto last  = part.find_last_not_of(' ');
    if (first != std::string::npos) {
      part = part.substr(first, last - first + 1);
      // "Table.Column"
      const auto dot = part.rfind('.');
      columns.push_back(dot == std::string::npos ? part : part.substr(dot + 1));
    }
    start = end + 1;
  }
  return columns;
}

} // namespace jwlmerge::merge
