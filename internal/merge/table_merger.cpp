#include "internal/merge/table_merger.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace jwlmerge::merge {

using db::ErrorCode;
using db::Result;
using db::sql::IsNull;
using db::sql::Values;
using observability::IntField;
using observability::StringField;
using schema::EntityDescriptor;

namespace {

std::string JoinColumns(const std::vector<std::string>& columns) {
  std::string out;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i != 0) out += ", ";
    out += columns[i];
  }
  return out;
}

std::string SelectSql(const EntityDescriptor& descriptor) {
  std::string sql = "SELECT ";
  if (descriptor.id_column) sql += *descriptor.id_column + ", ";
  sql += JoinColumns(descriptor.columns) + " FROM " + descriptor.table + ";";
  return sql;
}

std::string InsertSql(const EntityDescriptor& descriptor) {
  std::string placeholders;
  for (std::size_t i = 0; i < descriptor.columns.size(); ++i) {
    placeholders += i == 0 ? "?" : ",?";
  }
  return "INSERT INTO " + descriptor.table + " (" + JoinColumns(descriptor.columns) + ") VALUES (" + placeholders + ");";
}

std::string LookupSql(const EntityDescriptor& descriptor, const KeyPredicate& predicate) {
  if (descriptor.id_column) {
    return "SELECT " + *descriptor.id_column + " FROM " + descriptor.table + " WHERE " + predicate.where + " ORDER BY " + *descriptor.id_column +
           " LIMIT 1;";
  }
  return "SELECT 1 FROM " + descriptor.table + " WHERE " + predicate.where + " LIMIT 1;";
}

Result WithContext(Result result, const std::string& what) {
  result.message = what + ": " + result.message;
  return result;
}

} // namespace

TableMerger::TableMerger(db::sqlite::SqliteDB& source, db::sqlite::SqliteTransaction& destination)
    : source_(source), destination_(destination.DB()) {
}

Result TableMerger::FindExisting(const EntityDescriptor& descriptor, const KeyPredicate& predicate, Match* match) {
  *match = Match{};

  const auto sql = LookupSql(descriptor, predicate);
  auto       it  = lookups_.find(sql);
  if (it == lookups_.end()) {
    db::sqlite::SqliteStatement st;
    auto                        prepared = destination_.TryPrepare(sql, &st);
    if (!prepared) return WithContext(prepared, "prepare lookup");
    it = lookups_.emplace(sql, std::move(st)).first;
  }

  auto& st = it->second;
  st.Reset();
  int rc = st.BindAll(predicate.params);
  if (rc != SQLITE_OK) return WithContext(destination_.Translate(rc), "bind lookup");

  rc = st.Step();
  if (rc == SQLITE_ROW) {
    match->found = true;
    if (descriptor.id_column) match->id = st.ColumnInt64(0);
    st.Reset();
    return Result::Ok();
  }
  auto looked_up = destination_.Translate(rc);
  st.Reset();
  if (!looked_up) return WithContext(looked_up, "lookup");
  return Result::Ok();
}

Result TableMerger::FindConflicting(const EntityDescriptor& descriptor, const Values& record, const std::string& failure, Match* match) {
  auto result = FindExisting(descriptor, BuildKeyPredicate(descriptor, DuplicateKeyColumns(descriptor, record), record), match);
  if (!result || match->found) return result;

  // the constraint SQLite reported goes first; a row can collide with several
  const auto failed = FailedConstraintColumns(failure);
  auto       keys   = descriptor.unique_keys;
  std::stable_partition(keys.begin(), keys.end(), [&failed](const std::vector<std::string>& names) {
    return std::is_permutation(names.begin(), names.end(), failed.begin(), failed.end());
  });

  for (const auto& names : keys) {
    const auto key = ResolveColumns(descriptor, names);

    // NULLs are distinct in a UNIQUE index, so this constraint cannot have fired
    bool has_null = false;
    for (auto index : key) has_null = has_null || IsNull(record[index]);
    if (has_null) continue;

    result = FindExisting(descriptor, BuildKeyPredicate(descriptor, key, record), match);
    if (!result || match->found) return result;
  }
  return Result::Ok();
}

Result TableMerger::Merge(const EntityDescriptor& descriptor, const std::vector<ForeignKeyBinding>& bindings, IdTranslationTable& ids,
                          TableMergeReport* report) {
  *report      = TableMergeReport{};
  report->kind = descriptor.kind;

  const char* table = schema::ToString(descriptor.kind);

  struct BoundColumn {
    std::size_t  index;
    std::string  column;
    const IdMap* ids;
  };
  std::vector<BoundColumn> bound;
  for (const auto& binding : bindings) {
    auto index = descriptor.ColumnIndex(binding.column);
    if (!index) {
      return Result::Err(ErrorCode::InternalError, "no column " + binding.column + " in " + descriptor.table);
    }
    if (binding.ids) bound.push_back({*index, binding.column, binding.ids});
  }

  db::sqlite::SqliteStatement select;
  auto                        prepared = source_.TryPrepare(SelectSql(descriptor), &select);
  if (!prepared) return WithContext(prepared, "read source " + descriptor.table);

  db::sqlite::SqliteStatement insert;
  prepared = destination_.TryPrepare(InsertSql(descriptor), &insert);
  if (!prepared) return WithContext(prepared, "prepare insert into " + descriptor.table);

  const int offset = descriptor.id_column ? 1 : 0;
  const int width  = static_cast<int>(descriptor.columns.size());

  int rc;
  while ((rc = select.Step()) == SQLITE_ROW) {
    ++report->read;

    std::optional<std::int64_t> old_id;
    if (descriptor.id_column) old_id = select.ColumnInt64(0);

    Values values;
    values.reserve(static_cast<std::size_t>(width));
    for (int i = 0; i < width; ++i) values.push_back(select.Column(offset + i));

    JWLMERGE_LOG_DEBUG("Processing record", {StringField("table", table), StringField("values", db::sql::DescribeRow(descriptor.columns, values))});

    for (const auto& b : bound) {
      auto& value = values[b.index];
      if (IsNull(value)) continue;

      const auto* source_ref = std::get_if<std::int64_t>(&value);
      auto        mapped     = source_ref ? b.ids->find(*source_ref) : b.ids->end();
      if (source_ref && mapped != b.ids->end()) {
        JWLMERGE_LOG_DEBUG("Remapped reference", {StringField("table", table), StringField("column", b.column), IntField("from", *source_ref),
                                                  IntField("to", mapped->second)});
        value = mapped->second;
        continue;
      }

      JWLMERGE_LOG_WARN("No mapping found for reference",
                        {StringField("table", table), StringField("column", b.column), StringField("value", db::sql::ToDebugString(value))});
      report->warnings.push_back({MergeWarning::Type::UnresolvedReference, descriptor.kind, old_id, b.column, value});
    }

    const auto key       = DuplicateKeyColumns(descriptor, values);
    const auto predicate = BuildKeyPredicate(descriptor, key, values);

    Match existing;
    auto  found = FindExisting(descriptor, predicate, &existing);
    if (!found) return found;

    if (existing.found) {
      ++report->duplicates;
      JWLMERGE_LOG_DEBUG("Skipping existing record", {StringField("table", table), StringField("where", predicate.where)});
      if (old_id && existing.id) ids.Record(descriptor.kind, *old_id, *existing.id);
      continue;
    }

    insert.Reset();
    int bind_rc = insert.BindAll(values);
    if (bind_rc != SQLITE_OK) return WithContext(destination_.Translate(bind_rc), "bind insert into " + descriptor.table);

    int  step_rc  = insert.Step();
    auto inserted = destination_.Translate(step_rc);
    insert.Reset();

    if (inserted) {
      ++report->inserted;
      if (old_id) {
        const auto new_id = destination_.LastInsertRowId();
        ids.Record(descriptor.kind, *old_id, new_id);
        JWLMERGE_LOG_DEBUG("Inserted record", {StringField("table", table), IntField("from", *old_id), IntField("to", new_id)});
      }
      continue;
    }

    if (inserted.code != ErrorCode::Duplicate) {
      return WithContext(inserted, "insert into " + descriptor.table + " (" + db::sql::DescribeRow(descriptor.columns, values) + ")");
    }

    ++report->conflicts_recovered;
    JWLMERGE_LOG_WARN("Skipping duplicate record", {StringField("table", table), StringField("reason", inserted.message)});

    Match conflicting;
    auto  lookup = FindConflicting(descriptor, values, inserted.message, &conflicting);
    if (!lookup) return lookup;

    if (!conflicting.found) {
      JWLMERGE_LOG_WARN("Conflicting record not found", {StringField("table", table)});
      report->warnings.push_back({MergeWarning::Type::UnmatchedConflict, descriptor.kind, old_id, {}, nullptr});
      continue;
    }
    if (old_id && conflicting.id) ids.Record(descriptor.kind, *old_id, *conflicting.id);
  }

  if (rc != SQLITE_DONE) return WithContext(source_.Translate(rc), "read source " + descriptor.table);
  return Result::Ok();
}

} // namespace jwlmerge::merge
