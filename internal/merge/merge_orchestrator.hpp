#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/merge/merge_schedule.hpp"
#include "internal/merge/progress.hpp"
#include "internal/merge/table_merger.hpp"

namespace jwlmerge::merge {

struct MergeReport {
  std::vector<TableMergeReport> tables;

  const TableMergeReport* For(schema::EntityKind kind) const;

  std::size_t TotalInserted() const;
  std::size_t TotalDuplicates() const;

  std::vector<MergeWarning> AllWarnings() const;
};

/*
  Runs the schedule inside one destination transaction.

  Nothing is committed unless every kind merges. Failures surface as
  util::MergeFailure (a kind failed), util::ConstraintViolation (COMMIT
  rejected) or util::IOFailure (stores could not be opened or locked);
  in every case the destination is rolled back first.
*/
class MergeOrchestrator {
 public:
  explicit MergeOrchestrator(std::vector<MergeStep> schedule = DefaultSchedule());

  MergeReport Run(db::sqlite::SqliteDB& source, db::sqlite::SqliteDB& destination, ProgressReporter& progress) const;

  // Opens the source read-only and the destination read-write, and closes both before returning.
  MergeReport Run(const std::filesystem::path& source_db, const std::filesystem::path& destination_db, std::uint32_t busy_timeout_ms,
                  ProgressReporter& progress) const;

 private:
  std::vector<MergeStep> schedule_;
};

} // namespace jwlmerge::merge
