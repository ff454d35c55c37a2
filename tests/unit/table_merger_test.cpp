#include "internal/merge/table_merger.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "tests/support/backup_fixture.hpp"

namespace {

using jwlmerge::db::ErrorCode;
using jwlmerge::db::sqlite::OpenMode;
using jwlmerge::db::sqlite::SqliteDB;
using jwlmerge::db::sqlite::SqliteTransaction;
using jwlmerge::merge::ForeignKeyBinding;
using jwlmerge::merge::IdTranslationTable;
using jwlmerge::merge::MergeWarning;
using jwlmerge::merge::TableMergeReport;
using jwlmerge::merge::TableMerger;
using jwlmerge::schema::Describe;
using jwlmerge::schema::EntityKind;
using jwlmerge::testing::BackupFixture;

void TestDuplicatesMapAndNewRowsInsert() {
  BackupFixture source("tm_location_src");
  BackupFixture destination("tm_location_dst");
  destination.Exec("INSERT INTO Location (LocationId, BookNumber, ChapterNumber, KeySymbol, MepsLanguage, Type, Title) "
                   "VALUES (1, 40, 5, 'nwtsty', 0, 0, 'Matthew 5');");
  source.Exec("INSERT INTO Location (LocationId, BookNumber, ChapterNumber, KeySymbol, MepsLanguage, Type, Title) VALUES "
              "(7, 40, 5, 'nwtsty', 0, 0, 'Mt 5'), (8, 41, 1, 'nwtsty', 0, 0, 'Mark 1');");

  IdTranslationTable ids;
  TableMergeReport   report;
  {
    SqliteDB          src(source.StorePath().string(), OpenMode::ReadOnly);
    SqliteDB          dst(destination.StorePath().string(), OpenMode::ReadWrite);
    SqliteTransaction tx(dst);
    TableMerger       merger(src, tx);

    auto result = merger.Merge(Describe(EntityKind::Location), {}, ids, &report);
    assert(result);
    tx.Commit();
  }

  assert(report.read == 2);
  assert(report.duplicates == 1);
  assert(report.inserted == 1);
  assert(report.warnings.empty());
  assert(ids.Lookup(EntityKind::Location, 7) == 1);
  assert(ids.Lookup(EntityKind::Location, 8) == 2);

  assert(destination.Count("Location") == 2);
  // the existing row is kept as it was
  assert(destination.QueryText("SELECT Title FROM Location WHERE LocationId = 1;") == "Matthew 5");
}

void TestGuidConflictMapsOntoExistingNote() {
  BackupFixture source("tm_note_src");
  BackupFixture destination("tm_note_dst");
  destination.Exec("INSERT INTO Note (NoteId, Guid, Title, Content, LastModified, Created) "
                   "VALUES (3, 'guid-1', 'Old', 'old text', '2024-01-01', '2024-01-01');");
  source.Exec("INSERT INTO Note (NoteId, Guid, Title, Content, LastModified, Created) "
              "VALUES (1, 'guid-1', 'New', 'new text', '2024-02-01', '2024-01-01');");

  IdTranslationTable ids;
  TableMergeReport   report;
  {
    SqliteDB          src(source.StorePath().string(), OpenMode::ReadOnly);
    SqliteDB          dst(destination.StorePath().string(), OpenMode::ReadWrite);
    SqliteTransaction tx(dst);
    TableMerger       merger(src, tx);

    std::vector<ForeignKeyBinding> bindings = {{"UserMarkId", &ids.ForKind(EntityKind::UserMark)},
                                               {"LocationId", &ids.ForKind(EntityKind::Location)}};
    auto result = merger.Merge(Describe(EntityKind::Note), bindings, ids, &report);
    assert(result);
    tx.Commit();
  }

  assert(report.inserted == 0);
  assert(report.conflicts_recovered == 1);
  assert(report.warnings.empty());
  assert(ids.Lookup(EntityKind::Note, 1) == 3);
  assert(destination.Count("Note") == 1);
  assert(destination.QueryText("SELECT Content FROM Note;") == "old text");
}

void TestUnresolvedReferenceIsKeptWithWarning() {
  BackupFixture source("tm_usermark_src");
  BackupFixture destination("tm_usermark_dst");
  source.Exec("INSERT INTO UserMark (UserMarkId, ColorIndex, LocationId, StyleIndex, UserMarkGuid, Version) "
              "VALUES (4, 1, 99, 0, 'mark-1', 1);");

  IdTranslationTable ids;
  TableMergeReport   report;
  {
    SqliteDB          src(source.StorePath().string(), OpenMode::ReadOnly);
    SqliteDB          dst(destination.StorePath().string(), OpenMode::ReadWrite);
    SqliteTransaction tx(dst);
    TableMerger       merger(src, tx);

    auto result = merger.Merge(Describe(EntityKind::UserMark), {{"LocationId", &ids.ForKind(EntityKind::Location)}}, ids, &report);
    assert(result);
    tx.Commit();
  }

  assert(report.inserted == 1);
  assert(report.warnings.size() == 1);
  const auto& warning = report.warnings.front();
  assert(warning.type == MergeWarning::Type::UnresolvedReference);
  assert(warning.kind == EntityKind::UserMark);
  assert(warning.source_id == 4);
  assert(warning.column == "LocationId");
  assert(std::get<std::int64_t>(warning.value) == 99);
  assert(destination.QueryInt("SELECT LocationId FROM UserMark;") == 99);
}

void TestCompositeKeyWithoutSurrogateId() {
  BackupFixture source("tm_input_src");
  BackupFixture destination("tm_input_dst");
  source.Exec("INSERT INTO InputField VALUES (1, 'tt1', 'mine'), (1, 'tt2', 'also mine');");
  destination.Exec("INSERT INTO InputField VALUES (5, 'tt1', 'theirs');");

  IdTranslationTable ids;
  ids.Record(EntityKind::Location, 1, 5);
  TableMergeReport report;
  {
    SqliteDB          src(source.StorePath().string(), OpenMode::ReadOnly);
    SqliteDB          dst(destination.StorePath().string(), OpenMode::ReadWrite);
    SqliteTransaction tx(dst);
    TableMerger       merger(src, tx);

    auto result = merger.Merge(Describe(EntityKind::InputField), {{"LocationId", &ids.ForKind(EntityKind::Location)}}, ids, &report);
    assert(result);
    tx.Commit();
  }

  assert(report.read == 2);
  assert(report.inserted == 1);
  assert(report.conflicts_recovered == 1);
  assert(destination.Count("InputField") == 2);
  assert(destination.QueryText("SELECT Value FROM InputField WHERE TextTag = 'tt1';") == "theirs");
  assert(destination.QueryInt("SELECT LocationId FROM InputField WHERE TextTag = 'tt2';") == 5);
}

void TestOtherConstraintFailuresAreReturned() {
  BackupFixture source("tm_tag_src");
  BackupFixture destination("tm_tag_dst");
  source.Exec("DROP TABLE Tag; CREATE TABLE Tag (TagId INTEGER NOT NULL PRIMARY KEY, Type INTEGER NOT NULL, Name TEXT);");
  source.Exec("INSERT INTO Tag VALUES (1, 1, NULL);");

  IdTranslationTable ids;
  TableMergeReport   report;
  SqliteDB           src(source.StorePath().string(), OpenMode::ReadOnly);
  SqliteDB           dst(destination.StorePath().string(), OpenMode::ReadWrite);
  SqliteTransaction  tx(dst);
  TableMerger        merger(src, tx);

  auto result = merger.Merge(Describe(EntityKind::Tag), {}, ids, &report);
  assert(!result);
  assert(result.code == ErrorCode::ConstraintViolation);
  assert(result.message.find("Tag") != std::string::npos);
  tx.Rollback();
}

} // namespace

void TestConflictMapsOntoRowOfReportedConstraint() {
  BackupFixture source("tm_tagmap_src");
  BackupFixture destination("tm_tagmap_dst");
  // only (TagId, NoteId) is enforced here, so the insert can fail on nothing else
  destination.Exec("DROP TABLE TagMap;"
                   "CREATE TABLE TagMap (TagMapId INTEGER NOT NULL PRIMARY KEY, PlaylistItemId INTEGER, LocationId INTEGER, "
                   "NoteId INTEGER, TagId INTEGER NOT NULL, Position INTEGER NOT NULL, UNIQUE(TagId, NoteId));"
                   "INSERT INTO TagMap (TagMapId, NoteId, TagId, Position) VALUES (10, 5, 1, 3), (11, 7, 1, 0);");
  source.Exec("INSERT INTO TagMap (TagMapId, NoteId, TagId, Position) VALUES (1, 5, 1, 0);");

  IdTranslationTable ids;
  TableMergeReport   report;
  {
    SqliteDB          src(source.StorePath().string(), OpenMode::ReadOnly);
    SqliteDB          dst(destination.StorePath().string(), OpenMode::ReadWrite);
    SqliteTransaction tx(dst);
    TableMerger       merger(src, tx);

    auto result = merger.Merge(Describe(EntityKind::TagMap), {}, ids, &report);
    assert(result);
    tx.Commit();
  }

  assert(report.inserted == 0);
  assert(report.conflicts_recovered == 1);
  assert(report.warnings.empty());
  // row 11 shares (TagId, Position) but that is not the constraint that fired
  assert(ids.Lookup(EntityKind::TagMap, 1) == 10);
  assert(destination.Count("TagMap") == 2);
}

void TestLookupFailureKeepsSqliteMessage() {
  BackupFixture source("tm_lookup_src");
  BackupFixture destination("tm_lookup_dst");
  source.Exec("INSERT INTO Tag (TagId, Type, Name) VALUES (1, 1, 'Favorites');");

  IdTranslationTable ids;
  TableMergeReport   report;
  SqliteDB           src(source.StorePath().string(), OpenMode::ReadOnly);
  SqliteDB           dst(destination.StorePath().string(), OpenMode::ReadWrite);
  SqliteTransaction  tx(dst);
  TableMerger        merger(src, tx);

  auto first = merger.Merge(Describe(EntityKind::Tag), {}, ids, &report);
  assert(first);
  assert(report.inserted == 1);

  // the cached lookup selects TagId, which no longer exists; the insert does not need it
  dst.Exec("DROP TABLE Tag;");
  dst.Exec("CREATE TABLE Tag (Type INTEGER NOT NULL, Name TEXT NOT NULL);");

  auto second = merger.Merge(Describe(EntityKind::Tag), {}, ids, &report);
  assert(!second);
  assert(second.message.rfind("lookup: ", 0) == 0);
  assert(second.message.find("TagId") != std::string::npos);

  tx.Rollback();
}

int main() {
  TestDuplicatesMapAndNewRowsInsert();
  TestGuidConflictMapsOntoExistingNote();
  TestUnresolvedReferenceIsKeptWithWarning();
  TestCompositeKeyWithoutSurrogateId();
  TestOtherConstraintFailuresAreReturned();
  TestConflictMapsOntoRowOfReportedConstraint();
  TestLookupFailureKeepsSqliteMessage();

  std::cout << "jwlmerge_unit_table_merger: pass\n";
  return 0;
}
