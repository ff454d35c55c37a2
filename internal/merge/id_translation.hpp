#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "internal/schema/entity_schema.hpp"

namespace jwlmerge::merge {

using IdMap = std::unordered_map<std::int64_t, std::int64_t>;

/*
  Source-store id -> destination-store id, one map per entity kind.

  One table per merge run, passed explicitly to every table merge.
  Each source id is recorded once per run because every source row is
  read exactly once. A kind's map is only read after that kind has been
  merged; the merge schedule guarantees it, nothing here checks it.
*/
class IdTranslationTable {
 public:
  void Record(schema::EntityKind kind, std::int64_t source_id, std::int64_t destination_id);

  std::optional<std::int64_t> Lookup(schema::EntityKind kind, std::int64_t source_id) const;

  std::size_t Size(schema::EntityKind kind) const;

  const IdMap& ForKind(schema::EntityKind kind) const;

 private:
  std::array<IdMap, schema::kEntityKindCount> maps_;
};

} // namespace jwlmerge::merge
