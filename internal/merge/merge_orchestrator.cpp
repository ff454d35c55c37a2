#include "internal/merge/merge_orchestrator.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jwlmerge::merge {

using observability::IntField;
using observability::StringField;

namespace {

std::vector<ForeignKeyBinding> ResolveBindings(const schema::EntityDescriptor& descriptor, const IdTranslationTable& ids) {
  std::vector<ForeignKeyBinding> bindings;
  bindings.reserve(descriptor.foreign_keys.size());
  for (const auto& fk : descriptor.foreign_keys) {
    bindings.push_back({fk.column, &ids.ForKind(fk.references)});
  }
  return bindings;
}

std::string Summary(const TableMergeReport& report) {
  return "Merged " + std::string(schema::ToString(report.kind)) + " (" + std::to_string(report.inserted) + " added, " +
         std::to_string(report.duplicates + report.conflicts_recovered) + " already present)";
}

// Single abort path: roll back, then propagate the typed error.
template <typename Error>
[[noreturn]] void Abort(db::sqlite::SqliteTransaction& tx, const Error& error) {
  JWLMERGE_LOG_ERROR("Merge aborted, rolling back", {StringField("error", error.what()), StringField("kind", error.kind())});
  if (!tx.IsFinished()) {
    try {
      tx.Rollback();
    } catch (const std::exception& e) {
      JWLMERGE_LOG_ERROR("Rollback failed", {StringField("error", e.what())});
    }
  }
  throw error;
}

} // namespace

const TableMergeReport* MergeReport::For(schema::EntityKind kind) const {
  for (const auto& table : tables) {
    if (table.kind == kind) return &table;
  }
  return nullptr;
}

std::size_t MergeReport::TotalInserted() const {
  std::size_t total = 0;
  for (const auto& table : tables) total += table.inserted;
  return total;
}

std::size_t MergeReport::TotalDuplicates() const {
  std::size_t total = 0;
  for (const auto& table : tables) total += table.duplicates + table.conflicts_recovered;
  return total;
}

std::vector<MergeWarning> MergeReport::AllWarnings() const {
  std::vector<MergeWarning> warnings;
  for (const auto& table : tables) warnings.insert(warnings.end(), table.warnings.begin(), table.warnings.end());
  return warnings;
}

MergeOrchestrator::MergeOrchestrator(std::vector<MergeStep> schedule) : schedule_(std::move(schedule)) {
  ValidateSchedule(schedule_);
}

MergeReport MergeOrchestrator::Run(db::sqlite::SqliteDB& source, db::sqlite::SqliteDB& destination, ProgressReporter& progress) const {
  std::unique_ptr<db::sqlite::SqliteTransaction> tx;
  try {
    tx = std::make_unique<db::sqlite::SqliteTransaction>(destination);
  } catch (const std::runtime_error& e) {
    throw util::IOFailure(util::Phase::Merge, "cannot lock destination store: " + std::string(e.what()));
  }

  IdTranslationTable ids;
  TableMerger        merger(source, *tx);
  MergeReport        report;

  for (const auto& step : schedule_) {
    const auto& descriptor = schema::Describe(step.kind);
    progress.Report(step.start_progress, step.label);

    TableMergeReport table;
    auto             result = merger.Merge(descriptor, ResolveBindings(descriptor, ids), ids, &table);
    if (!result) {
      Abort(*tx, util::MergeFailure(descriptor.table, result.code, result.message));
    }

    JWLMERGE_LOG_INFO(Summary(table), {IntField("read", static_cast<std::int64_t>(table.read)),
                                       IntField("inserted", static_cast<std::int64_t>(table.inserted)),
                                       IntField("duplicates", static_cast<std::int64_t>(table.duplicates)),
                                       IntField("conflicts", static_cast<std::int64_t>(table.conflicts_recovered)),
                                       IntField("warnings", static_cast<std::int64_t>(table.warnings.size()))});
    progress.Report(step.end_progress, Summary(table));
    report.tables.push_back(std::move(table));
  }

  try {
    tx->Commit();
  } catch (const std::runtime_error& e) {
    Abort(*tx, util::ConstraintViolation(e.what()));
  }
  return report;
}

MergeReport MergeOrchestrator::Run(const std::filesystem::path& source_db, const std::filesystem::path& destination_db,
                                   std::uint32_t busy_timeout_ms, ProgressReporter& progress) const {
  std::unique_ptr<db::sqlite::SqliteDB> source;
  std::unique_ptr<db::sqlite::SqliteDB> destination;
  try {
    source      = std::make_unique<db::sqlite::SqliteDB>(source_db.string(), db::sqlite::OpenMode::ReadOnly, busy_timeout_ms);
    destination = std::make_unique<db::sqlite::SqliteDB>(destination_db.string(), db::sqlite::OpenMode::ReadWrite, busy_timeout_ms);
  } catch (const std::runtime_error& e) {
    throw util::IOFailure(util::Phase::Merge, e.what());
  }

  return Run(*source, *destination, progress);
}

} // namespace jwlmerge::merge
