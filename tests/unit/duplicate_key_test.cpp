#include "internal/merge/duplicate_key.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

using jwlmerge::db::sql::Values;
using jwlmerge::merge::BuildKeyPredicate;
using jwlmerge::merge::DuplicateKeyColumns;
using jwlmerge::merge::FailedConstraintColumns;
using jwlmerge::merge::KeyColumns;
using jwlmerge::merge::ResolveColumns;
using jwlmerge::schema::Describe;
using jwlmerge::schema::EntityKind;

std::vector<std::string> Names(EntityKind kind, const KeyColumns& key) {
  std::vector<std::string> names;
  for (auto index : key) names.push_back(Describe(kind).columns.at(index));
  return names;
}

// BookNumber, ChapterNumber, DocumentId, Track, IssueTagNumber, KeySymbol, MepsLanguage, Type, Title
Values Location(Values::value_type book, Values::value_type chapter, Values::value_type document, Values::value_type track,
                std::int64_t type) {
  return {book, chapter, document, track, std::int64_t{0}, std::string("nwtsty"), std::int64_t{0}, type, std::string("title")};
}

void TestBibleChapterLocationKey() {
  auto record = Location(std::int64_t{1}, std::int64_t{3}, nullptr, nullptr, 0);
  auto names  = Names(EntityKind::Location, DuplicateKeyColumns(Describe(EntityKind::Location), record));
  assert((names == std::vector<std::string>{"BookNumber", "ChapterNumber", "KeySymbol", "MepsLanguage", "Type"}));
}

void TestDocumentLocationKeyIncludesDocumentId() {
  auto record = Location(nullptr, nullptr, std::int64_t{1102021}, nullptr, 0);
  auto names  = Names(EntityKind::Location, DuplicateKeyColumns(Describe(EntityKind::Location), record));
  assert((names == std::vector<std::string>{"BookNumber", "ChapterNumber", "KeySymbol", "MepsLanguage", "Type", "DocumentId"}));
}

void TestTrackLocationKey() {
  auto record = Location(nullptr, nullptr, std::int64_t{1102021}, std::int64_t{4}, 3);
  auto names  = Names(EntityKind::Location, DuplicateKeyColumns(Describe(EntityKind::Location), record));
  assert((names == std::vector<std::string>{"KeySymbol", "IssueTagNumber", "MepsLanguage", "DocumentId", "Track", "Type"}));
}

void TestOtherKindsCompareEveryColumn() {
  const auto& tag = Describe(EntityKind::Tag);
  Values      record{std::int64_t{1}, std::string("Favorites")};
  auto        key = DuplicateKeyColumns(tag, record);
  assert(key.size() == tag.columns.size());
  assert((Names(EntityKind::Tag, key) == std::vector<std::string>{"Type", "Name"}));

  const auto& note = Describe(EntityKind::Note);
  assert(DuplicateKeyColumns(note, Values(note.columns.size(), nullptr)).size() == note.columns.size());
}

void TestPredicateMatchesNullExactly() {
  const auto& location = Describe(EntityKind::Location);
  auto        record   = Location(std::int64_t{1}, std::int64_t{3}, nullptr, nullptr, 0);
  record[5]            = nullptr; // KeySymbol

  auto predicate = BuildKeyPredicate(location, DuplicateKeyColumns(location, record), record);
  assert(predicate.where == "BookNumber = ? AND ChapterNumber = ? AND KeySymbol IS NULL AND MepsLanguage = ? AND Type = ?");
  assert(predicate.params.size() == 4);
  assert(std::get<std::int64_t>(predicate.params[0]) == 1);
  assert(std::get<std::int64_t>(predicate.params[1]) == 3);
}

void TestUnknownColumnIsALogicError() {
  bool threw = false;
  try {
    (void)ResolveColumns(Describe(EntityKind::Tag), {"Type", "Colour"});
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFailedConstraintColumnsFromSqliteMessage() {
  assert((FailedConstraintColumns("UNIQUE constraint failed: TagMap.TagId, TagMap.NoteId") == std::vector<std::string>{"TagId", "NoteId"}));
  assert((FailedConstraintColumns("UNIQUE constraint failed: Note.Guid") == std::vector<std::string>{"Guid"}));
  assert(FailedConstraintColumns("database is locked").empty());
  assert(FailedConstraintColumns("UNIQUE constraint failed: ").empty());
}

} // namespace

int main() {
  TestBibleChapterLocationKey();
  TestDocumentLocationKeyIncludesDocumentId();
  TestTrackLocationKey();
  TestOtherKindsCompareEveryColumn();
  TestPredicateMatchesNullExactly();
  TestUnknownColumnIsALogicError();
  TestFailedConstraintColumnsFromSqliteMessage();

  std::cout << "jwlmerge_unit_duplicate_key: pass\n";
  return 0;
}
