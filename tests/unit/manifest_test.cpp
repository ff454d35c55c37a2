#include "internal/manifest/manifest.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/time.hpp"
#include "tests/support/backup_fixture.hpp"

namespace {

using jwlmerge::manifest::ApplyMergeUpdates;
using jwlmerge::manifest::Manifest;
using jwlmerge::manifest::ValidateCompatible;
using jwlmerge::testing::ManifestJson;
using jwlmerge::util::IncompatibleInput;
using jwlmerge::util::Phase;

bool RejectsAsIncompatible(const std::string& json) {
  try {
    (void)Manifest::Parse(json);
  } catch (const IncompatibleInput& e) {
    return e.phase() == Phase::Validate;
  }
  return false;
}

void TestParsesBackupFields() {
  auto manifest = Manifest::Parse(ManifestJson(14, "2024-02-03T04:05:06Z", "Backup.jwlibrary"));
  assert(manifest.SchemaVersionText() == "14");
  assert(manifest.DatabaseName("fallback.db") == "userData.db");
  assert(manifest.LastModified() == std::string("2024-02-03T04:05:06Z"));
  assert(manifest.Name() == "Backup.jwlibrary");

  auto bare = Manifest::Parse(R"({"userDataBackup": {"schemaVersion": 13}})");
  assert(bare.DatabaseName("fallback.db") == "fallback.db");
  assert(!bare.LastModified().has_value());
}

void TestMalformedManifestsAreIncompatible() {
  assert(RejectsAsIncompatible("{not json"));
  assert(RejectsAsIncompatible("[1, 2, 3]"));
  assert(RejectsAsIncompatible(R"({"name": "x"})"));
  assert(RejectsAsIncompatible(R"({"userDataBackup": "x"})"));
  assert(RejectsAsIncompatible(R"({"userDataBackup": {"databaseName": "userData.db"}})"));
  assert(RejectsAsIncompatible(R"({"userDataBackup": {"schemaVersion": null}})"));
}

void TestSchemaVersionMismatch() {
  auto source      = Manifest::Parse(ManifestJson(14));
  auto destination = Manifest::Parse(ManifestJson(13));
  ValidateCompatible(source, Manifest::Parse(ManifestJson(14)));

  bool threw = false;
  try {
    ValidateCompatible(source, destination);
  } catch (const IncompatibleInput& e) {
    threw = std::string(e.what()).find("Schema versions do not match") != std::string::npos;
  }
  assert(threw);

  // "14" is not 14
  threw = false;
  try {
    ValidateCompatible(source, Manifest::Parse(R"({"userDataBackup": {"schemaVersion": "14"}})"));
  } catch (const IncompatibleInput&) {
    threw = true;
  }
  assert(threw);
}

void TestUnparseableTimestampIsIncompatible() {
  auto source = Manifest::Parse(ManifestJson(14, "last tuesday"));
  bool threw  = false;
  try {
    ValidateCompatible(source, Manifest::Parse(ManifestJson(14)));
  } catch (const IncompatibleInput&) {
    threw = true;
  }
  assert(threw);
}

void TestLaterSourceTimestampWins() {
  auto destination = Manifest::Parse(ManifestJson(14, "2024-01-01T10:00:00+00:00"));
  auto source      = Manifest::Parse(ManifestJson(14, "2024-01-01T10:00:01+00:00"));
  ApplyMergeUpdates(&destination, source, "abc123", jwlmerge::util::Now());
  assert(destination.LastModified() == std::string("2024-01-01T10:00:01+00:00"));
  assert(destination.Hash() == "abc123");
}

void TestTiesAndOlderSourceKeepDestination() {
  // same instant written differently
  auto destination = Manifest::Parse(ManifestJson(14, "2024-01-01T11:00:00+01:00"));
  ApplyMergeUpdates(&destination, Manifest::Parse(ManifestJson(14, "2024-01-01T10:00:00Z")), "h", jwlmerge::util::Now());
  assert(destination.LastModified() == std::string("2024-01-01T11:00:00+01:00"));

  ApplyMergeUpdates(&destination, Manifest::Parse(ManifestJson(14, "2023-06-01T00:00:00Z")), "h", jwlmerge::util::Now());
  assert(destination.LastModified() == std::string("2024-01-01T11:00:00+01:00"));
}

void TestNameAndCreationDate() {
  const auto now         = jwlmerge::util::Now();
  auto       destination = Manifest::Parse(ManifestJson());
  ApplyMergeUpdates(&destination, Manifest::Parse(ManifestJson()), "h", now);

  assert(destination.Name() == jwlmerge::util::MergedBackupName(now) + ".jwlibrary");
  assert(destination.Name().rfind("merged_", 0) == 0);

  auto created = jwlmerge::util::ParseIso8601(destination.CreationDate());
  assert(created);
  assert(std::chrono::duration_cast<std::chrono::seconds>(now - *created).count() == 0);
}

void TestUnknownKeysSurviveRewrite() {
  auto destination = Manifest::Parse(ManifestJson());
  ApplyMergeUpdates(&destination, Manifest::Parse(ManifestJson()), "feed", jwlmerge::util::Now());

  const auto json = destination.ToJson();
  assert(json.find("\"deviceName\"") != std::string::npos);
  assert(json.find("TestDevice") != std::string::npos);
  assert(json.find('\n') != std::string::npos);

  auto reparsed = Manifest::Parse(json);
  assert(reparsed.SchemaVersionText() == "14");
  assert(reparsed.Hash() == "feed");
  assert(reparsed.Root().fields().count("type") == 1);
}

} // namespace

int main() {
  TestParsesBackupFields();
  TestMalformedManifestsAreIncompatible();
  TestSchemaVersionMismatch();
  TestUnparseableTimestampIsIncompatible();
  TestLaterSourceTimestampWins();
  TestTiesAndOlderSourceKeepDestination();
  TestNameAndCreationDate();
  TestUnknownKeysSurviveRewrite();

  std::cout << "jwlmerge_unit_manifest: pass\n";
  return 0;
}
