#pragma once

#include <string>
#include <vector>

#include "internal/schema/entity_schema.hpp"

namespace jwlmerge::merge {

// One entity kind's slot in a run: progress goes start -> end while it merges.
struct MergeStep {
  schema::EntityKind kind;
  int                start_progress;
  int                end_progress;
  std::string        label;
};

/*
  Location, UserMark, BlockRange, Note, PlaylistItem, Tag, InputField, TagMap.

  Every kind comes after all kinds its foreign keys reference, so each
  translation map is complete before anything reads it.
*/
const std::vector<MergeStep>& DefaultSchedule();

// Throws std::logic_error if a kind repeats, references a kind not merged
// before it, or if progress ranges go backwards.
void ValidateSchedule(const std::vector<MergeStep>& schedule);

} // namespace jwlmerge::merge
