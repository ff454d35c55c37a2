#include "internal/schema/entity_schema.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace jwlmerge::schema {

namespace {

std::array<EntityDescriptor, kEntityKindCount> BuildRegistry() {
  return {{
      {EntityKind::Location,
       "Location",
       "LocationId",
       {"BookNumber", "ChapterNumber", "DocumentId", "Track", "IssueTagNumber", "KeySymbol", "MepsLanguage", "Type", "Title"},
       {},
       {{"BookNumber", "ChapterNumber", "KeySymbol", "MepsLanguage", "Type"},
        {"KeySymbol", "IssueTagNumber", "MepsLanguage", "DocumentId", "Track", "Type"}}},

      {EntityKind::UserMark,
       "UserMark",
       "UserMarkId",
       {"ColorIndex", "LocationId", "StyleIndex", "UserMarkGuid", "Version"},
       {{"LocationId", EntityKind::Location}},
       {{"UserMarkGuid"}}},

      {EntityKind::BlockRange,
       "BlockRange",
       "BlockRangeId",
       {"BlockType", "Identifier", "StartToken", "EndToken", "UserMarkId"},
       {{"UserMarkId", EntityKind::UserMark}},
       {}},

      {EntityKind::Note,
       "Note",
       "NoteId",
       {"Guid", "UserMarkId", "LocationId", "Title", "Content", "LastModified", "Created", "BlockType", "BlockIdentifier"},
       {{"UserMarkId", EntityKind::UserMark}, {"LocationId", EntityKind::Location}},
       {{"Guid"}}},

      {EntityKind::PlaylistItem,
       "PlaylistItem",
       "PlaylistItemId",
       {"Label", "StartTrimOffsetTicks", "EndTrimOffsetTicks", "Accuracy", "EndAction", "ThumbnailFilePath"},
       {},
       {}},

      {EntityKind::Tag, "Tag", "TagId", {"Type", "Name"}, {}, {{"Type", "Name"}}},

      {EntityKind::InputField,
       "InputField",
       std::nullopt,
       {"LocationId", "TextTag", "Value"},
       {{"LocationId", EntityKind::Location}},
       {{"LocationId", "TextTag"}}},

      {EntityKind::TagMap,
       "TagMap",
       "TagMapId",
       {"PlaylistItemId", "LocationId", "NoteId", "TagId", "Position"},
       {{"PlaylistItemId", EntityKind::PlaylistItem},
        {"LocationId", EntityKind::Location},
        {"NoteId", EntityKind::Note},
        {"TagId", EntityKind::Tag}},
       {{"TagId", "Position"}, {"TagId", "NoteId"}, {"TagId", "LocationId"}, {"TagId", "PlaylistItemId"}}},
  }};
}

const std::array<EntityDescriptor, kEntityKindCount>& Registry() {
  static const auto registry = BuildRegistry();
  return registry;
}

} // namespace

std::optional<std::size_t> EntityDescriptor::ColumnIndex(const std::string& column) const {
  auto it = std::find(columns.begin(), columns.end(), column);
  if (it == columns.end()) return std::nullopt;
  return static_cast<std::size_t>(it - columns.begin());
}

const char* ToString(EntityKind kind) {
  switch (kind) {
    case EntityKind::Location:
      return "Location";
    case EntityKind::UserMark:
      return "UserMark";
    case EntityKind::BlockRange:
      return "BlockRange";
    case EntityKind::Note:
      return "Note";
    case EntityKind::PlaylistItem:
      return "PlaylistItem";
    case EntityKind::Tag:
      return "Tag";
    case EntityKind::InputField:
      return "InputField";
    case EntityKind::TagMap:
      return "TagMap";
  }
  return "Unknown";
}

const EntityDescriptor& Describe(EntityKind kind) {
  const auto& descriptor = Registry()[static_cast<std::size_t>(kind)];
  if (descriptor.kind != kind) {
    throw std::logic_error("entity registry out of order at " + std::string(ToString(kind)));
  }
  return descriptor;
}

const std::array<EntityKind, kEntityKindCount>& AllEntityKinds() {
  static const std::array<EntityKind, kEntityKindCount> kinds = {EntityKind::Location,     EntityKind::UserMark, EntityKind::BlockRange,
                                                                 EntityKind::Note,         EntityKind::PlaylistItem, EntityKind::Tag,
                                                                 EntityKind::InputField,   EntityKind::TagMap};
  return kinds;
}

std::vector<std::string> MissingColumns(db::sqlite::SqliteDB& db, const EntityDescriptor& descriptor) {
  const auto present = db.TableColumns(descriptor.table);

  std::vector<std::string> expected;
  if (descriptor.id_column) expected.push_back(*descriptor.id_column);
  expected.insert(expected.end(), descriptor.columns.begin(), descriptor.columns.end());

  std::vector<std::string> missing;
  for (const auto& column : expected) {
    if (std::find(present.begin(), present.end(), column) == present.end()) {
      missing.push_back(column);
    }
  }
  return missing;
}

} // namespace jwlmerge::schema
