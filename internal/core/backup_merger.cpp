#include "internal/core/backup_merger.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/archive/workspace.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/manifest/manifest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/entity_schema.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jwlmerge::core {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;
using util::IncompatibleInput;
using util::Phase;

namespace {

fs::path StorePath(const fs::path& dir, const std::string& name, const char* which) {
  if (name == "." || name == ".." || fs::path(name).filename().string() != name) {
    throw IncompatibleInput(Phase::Validate, std::string("Invalid database name in ") + which + " manifest: " + name);
  }

  std::error_code ec;
  fs::path        path = dir / name;
  if (!fs::is_regular_file(path, ec)) {
    throw IncompatibleInput(Phase::Validate, std::string("Missing database file in ") + which + " backup: " + name);
  }
  return path;
}

void CheckStoreShape(const fs::path& path, std::uint32_t busy_timeout_ms, const char* which) {
  try {
    db::sqlite::SqliteDB store(path.string(), db::sqlite::OpenMode::ReadOnly, busy_timeout_ms);
    for (auto kind : schema::AllEntityKinds()) {
      const auto& descriptor = schema::Describe(kind);
      const auto  missing    = schema::MissingColumns(store, descriptor);
      if (missing.empty()) continue;

      std::string columns;
      for (const auto& column : missing) columns += (columns.empty() ? "" : ", ") + column;
      throw IncompatibleInput(Phase::Validate, std::string("The ") + which + " database has no " + descriptor.table + " columns: " + columns);
    }
  } catch (const util::MergeError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw IncompatibleInput(Phase::Validate, std::string("Unreadable ") + which + " database: " + e.what());
  }
}

} // namespace

BackupMerger::BackupMerger(jwlmerge::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

MergeOutcome BackupMerger::Merge(const std::vector<std::uint8_t>& source_archive, const std::vector<std::uint8_t>& destination_archive,
                                 merge::ProgressSink* sink) const {
  merge::ProgressReporter progress(sink);

  // ------------------------------------------------------------
  // Extract
  // ------------------------------------------------------------
  progress.Report(10, "Extracting archive files...");

  auto workspace = archive::Workspace::Create(config_.workspace().temp_root());

  archive::ZipLimits limits;
  limits.max_entry_bytes = config_.archive().max_entry_bytes();

  const auto source_files      = archive::Unpack(source_archive, workspace.SourceDir(), limits);
  const auto destination_files = archive::Unpack(destination_archive, workspace.DestinationDir(), limits);
  JWLMERGE_LOG_INFO("Extracted backups", {IntField("source_files", static_cast<std::int64_t>(source_files.size())),
                                          IntField("destination_files", static_cast<std::int64_t>(destination_files.size())),
                                          StringField("workspace", workspace.Root().string())});

  // ------------------------------------------------------------
  // Validate
  // ------------------------------------------------------------
  progress.Report(25, "Validating backup files...");

  const auto& store_config         = config_.store();
  const auto  source_manifest      = manifest::Manifest::Load(workspace.SourceDir() / store_config.manifest_name());
  auto        destination_manifest = manifest::Manifest::Load(workspace.DestinationDir() / store_config.manifest_name());
  manifest::ValidateCompatible(source_manifest, destination_manifest);

  const auto source_db =
      StorePath(workspace.SourceDir(), source_manifest.DatabaseName(store_config.default_database_name()), "source");
  const auto destination_db =
      StorePath(workspace.DestinationDir(), destination_manifest.DatabaseName(store_config.default_database_name()), "destination");

  CheckStoreShape(source_db, store_config.busy_timeout_ms(), "source");
  CheckStoreShape(destination_db, store_config.busy_timeout_ms(), "destination");
  JWLMERGE_LOG_INFO("Backups are compatible", {StringField("schema_version", source_manifest.SchemaVersionText())});

  // ------------------------------------------------------------
  // Merge
  // ------------------------------------------------------------
  progress.Report(35, "Starting database merge...");

  MergeOutcome outcome;
  outcome.report = orchestrator_.Run(source_db, destination_db, store_config.busy_timeout_ms(), progress);

  // ------------------------------------------------------------
  // Finalize and pack
  // ------------------------------------------------------------
  progress.Report(85, "Updating manifest and creating archive...");

  // both store handles are closed by now, so the file is final
  const auto hash = util::Sha256File(destination_db);
  manifest::ApplyMergeUpdates(&destination_manifest, source_manifest, hash, util::Now());
  destination_manifest.Save(workspace.DestinationDir() / store_config.manifest_name());

  outcome.archive       = archive::Pack(workspace.DestinationDir(), config_.archive().compression_level());
  outcome.file_name     = destination_manifest.Name();
  outcome.manifest_json = destination_manifest.ToJson();

  JWLMERGE_LOG_INFO("Merged backup created", {StringField("name", outcome.file_name), StringField("hash", hash),
                                              IntField("bytes", static_cast<std::int64_t>(outcome.archive.size())),
                                              IntField("inserted", static_cast<std::int64_t>(outcome.report.TotalInserted())),
                                              IntField("duplicates", static_cast<std::int64_t>(outcome.report.TotalDuplicates())),
                                              IntField("warnings", static_cast<std::int64_t>(outcome.report.AllWarnings().size()))});

  progress.Report(100, "Merge completed successfully!");
  return outcome;
}

} // namespace jwlmerge::core
