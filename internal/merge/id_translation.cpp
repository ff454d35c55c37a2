#include "internal/merge/id_translation.hpp"

namespace jwlmerge::merge {

void IdTranslationTable::Record(schema::EntityKind kind, std::int64_t source_id, std::int64_t destination_id) {
  maps_[static_cast<std::size_t>(kind)][source_id] = destination_id;
}

std::optional<std::int64_t> IdTranslationTable::Lookup(schema::EntityKind kind, std::int64_t source_id) const {
  const auto& map = maps_[static_cast<std::size_t>(kind)];
  auto        it  = map.find(source_id);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

std::size_t IdTranslationTable::Size(schema::EntityKind kind) const {
  return maps_[static_cast<std::size_t>(kind)].size();
}

const IdMap& IdTranslationTable::ForKind(schema::EntityKind kind) const {
  return maps_[static_cast<std::size_t>(kind)];
}

} // namespace jwlmerge::merge
