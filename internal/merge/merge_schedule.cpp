#include "internal/merge/merge_schedule.hpp"

#include <array>
#include <stdexcept>

namespace jwlmerge::merge {

using schema::EntityKind;

const std::vector<MergeStep>& DefaultSchedule() {
  static const std::vector<MergeStep> schedule = {
      {EntityKind::Location, 35, 45, "Merging locations..."},
      {EntityKind::UserMark, 45, 55, "Merging user marks..."},
      {EntityKind::BlockRange, 55, 60, "Merging block ranges..."},
      {EntityKind::Note, 60, 70, "Merging notes..."},
      {EntityKind::PlaylistItem, 70, 75, "Merging playlist items..."},
      {EntityKind::Tag, 75, 78, "Merging tags..."},
      {EntityKind::InputField, 78, 80, "Merging input fields..."},
      {EntityKind::TagMap, 80, 85, "Merging tag mappings..."},
  };
  return schedule;
}

void ValidateSchedule(const std::vector<MergeStep>& schedule) {
  std::array<bool, schema::kEntityKindCount> merged{};
  int                                        last_progress = 0;

  for (const auto& step : schedule) {
    const auto  index = static_cast<std::size_t>(step.kind);
    const std::string name = schema::ToString(step.kind);

    if (merged[index]) {
      throw std::logic_error("schedule merges " + name + " twice");
    }
    for (const auto& fk : schema::Describe(step.kind).foreign_keys) {
      if (!merged[static_cast<std::size_t>(fk.references)]) {
        throw std::logic_error("schedule merges " + name + " before " + schema::ToString(fk.references) + " (" + fk.column + ")");
      }
    }
    if (step.start_progress < last_progress || step.end_progress < step.start_progress) {
      throw std::logic_error("schedule progress goes backwards at " + name);
    }

    merged[index] = true;
    last_progress = step.end_progress;
  }
}

} // namespace jwlmerge::merge
