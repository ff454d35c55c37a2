#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/db/sql/sql_value.hpp"
#include "internal/schema/entity_schema.hpp"

namespace jwlmerge::merge {

// Indexes into descriptor.columns
using KeyColumns = std::vector<std::size_t>;

/*
  Columns whose exact match means "this record already exists".

  Every kind compares all of its non-surrogate columns, except Location,
  whose key follows the store's uniqueness constraint for its Type:

    Type == 3           KeySymbol, IssueTagNumber, MepsLanguage, DocumentId, Track, Type
    DocumentId present  BookNumber, ChapterNumber, KeySymbol, MepsLanguage, Type, DocumentId
    otherwise           BookNumber, ChapterNumber, KeySymbol, MepsLanguage, Type
*/
KeyColumns DuplicateKeyColumns(const schema::EntityDescriptor& descriptor, const db::sql::Values& record);

// Index form of a named column set; throws std::logic_error for an unknown column.
KeyColumns ResolveColumns(const schema::EntityDescriptor& descriptor, const std::vector<std::string>& names);

/*
  WHERE clause matching the key columns exactly. NULL compares with
  IS NULL, never as a wildcard. params holds only the non-NULL values,
  in placeholder order.
*/
struct KeyPredicate {
  std::string      where;
  db::sql::Values  params;
};

KeyPredicate BuildKeyPredicate(const schema::EntityDescriptor& descriptor, const KeyColumns& key, const db::sql::Values& record);

/*
  Columns named by a SQLite uniqueness failure, e.g.
  "UNIQUE constraint failed: TagMap.TagId, TagMap.NoteId" gives {TagId, NoteId}.
  Empty when the message has another shape.
*/
std::vector<std::string> FailedConstraintColumns(const std::string& message);

} // namespace jwlmerge::merge
