#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/merge/merge_orchestrator.hpp"
#include "internal/merge/progress.hpp"

namespace jwlmerge::core {

struct MergeOutcome {
  std::vector<std::uint8_t> archive;

  // merged_<date>_<time>.jwlibrary, same as the manifest name
  std::string file_name;

  std::string        manifest_json;
  merge::MergeReport report;
};

/*
  End-to-end merge of two backup archives.

  Extract -> validate -> merge -> finalize -> pack, all inside a private
  workspace that is removed before Merge() returns or throws. The input
  byte buffers are never modified. Failures are util::MergeError subclasses.
*/
class BackupMerger {
 public:
  explicit BackupMerger(jwlmerge::runtime::config::RuntimeConfig config);

  MergeOutcome Merge(const std::vector<std::uint8_t>& source_archive, const std::vector<std::uint8_t>& destination_archive,
                     merge::ProgressSink* sink = nullptr) const;

 private:
  jwlmerge::runtime::config::RuntimeConfig config_;
  merge::MergeOrchestrator                 orchestrator_;
};

} // namespace jwlmerge::core
