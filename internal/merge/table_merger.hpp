#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/sql_value.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/merge/duplicate_key.hpp"
#include "internal/merge/id_translation.hpp"
#include "internal/schema/entity_schema.hpp"

namespace jwlmerge::merge {

// A foreign-key column and the translation map its values go through.
struct ForeignKeyBinding {
  std::string  column;
  const IdMap* ids = nullptr;
};

struct MergeWarning {
  enum class Type {
    // non-NULL reference with no translation; the source value was kept
    UnresolvedReference,
    // insert hit a uniqueness constraint but no conflicting row could be found
    UnmatchedConflict
  };

  Type                        type;
  schema::EntityKind          kind;
  std::optional<std::int64_t> source_id;
  std::string                 column;
  db::sql::Value              value;
};

struct TableMergeReport {
  schema::EntityKind kind = schema::EntityKind::Location;

  std::size_t read                = 0;
  std::size_t inserted            = 0;
  std::size_t duplicates          = 0;
  std::size_t conflicts_recovered = 0;

  std::vector<MergeWarning> warnings;
};

/*
  Merges every source row of one entity kind into the destination.

  Per row: remap foreign keys, look for an existing row by the kind's
  duplicate key, insert if absent, and record old id -> new id for kinds
  with a surrogate id. A UNIQUE/PRIMARY KEY rejection on insert is
  resolved by finding the row that caused it. Any other store error
  stops the kind and is returned; the caller owns the transaction and
  decides whether to roll back.
*/
class TableMerger {
 public:
  TableMerger(db::sqlite::SqliteDB& source, db::sqlite::SqliteTransaction& destination);

  db::Result Merge(const schema::EntityDescriptor& descriptor, const std::vector<ForeignKeyBinding>& bindings, IdTranslationTable& ids,
                   TableMergeReport* report);

 private:
  struct Match {
    bool                        found = false;
    std::optional<std::int64_t> id;
  };

  db::Result FindExisting(const schema::EntityDescriptor& descriptor, const KeyPredicate& predicate, Match* match);
  db::Result FindConflicting(const schema::EntityDescriptor& descriptor, const db::sql::Values& record, const std::string& failure,
                             Match* match);

  db::sqlite::SqliteDB& source_;
  db::sqlite::SqliteDB& destination_;

  // lookup statements keyed by SQL text; the NULL pattern of a key changes the text
  std::unordered_map<std::string, db::sqlite::SqliteStatement> lookups_;
};

} // namespace jwlmerge::merge
