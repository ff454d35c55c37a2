#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jwlmerge::db::sqlite {
class SqliteDB;
}

namespace jwlmerge::schema {

/*
  Static description of the backup store's user-data tables.

  The merge never introspects the store to learn a table's shape; it
  reads and writes exactly the columns listed here. MissingColumns()
  only verifies that a store actually has them.
*/

enum class EntityKind {
  Location,
  UserMark,
  BlockRange,
  Note,
  PlaylistItem,
  Tag,
  InputField,
  TagMap
};

inline constexpr std::size_t kEntityKindCount = 8;

// Location.Type discriminant for a document with a track
inline constexpr std::int64_t kLocationTypeDocumentWithTrack = 3;

struct ForeignKey {
  std::string column;
  EntityKind  references;
};

struct EntityDescriptor {
  EntityKind  kind;
  std::string table;

  // auto-assigned INTEGER PRIMARY KEY; not copied between stores
  std::optional<std::string> id_column;

  // every other column, in read/insert order
  std::vector<std::string> columns;

  std::vector<ForeignKey> foreign_keys;

  // UNIQUE / PRIMARY KEY constraints the store enforces on non-surrogate columns
  std::vector<std::vector<std::string>> unique_keys;

  bool HasSurrogateId() const {
    return id_column.has_value();
  }

  // index into columns, or nullopt
  std::optional<std::size_t> ColumnIndex(const std::string& column) const;
};

const char* ToString(EntityKind kind);

const EntityDescriptor& Describe(EntityKind kind);

const std::array<EntityKind, kEntityKindCount>& AllEntityKinds();

// Columns of the descriptor (surrogate id included) that the store's table lacks.
// A missing table reports every column.
std::vector<std::string> MissingColumns(db::sqlite::SqliteDB& db, const EntityDescriptor& descriptor);

} // namespace jwlmerge::schema
