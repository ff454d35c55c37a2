#include "internal/manifest/manifest.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cstdint>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/file_io.hpp"

namespace jwlmerge::manifest {

using google::protobuf::Struct;
using google::protobuf::Value;
using observability::StringField;
using util::IncompatibleInput;
using util::Phase;

namespace {

constexpr const char* kBackupKey        = "userDataBackup";
constexpr const char* kSchemaVersionKey = "schemaVersion";
constexpr const char* kDatabaseNameKey  = "databaseName";
constexpr const char* kLastModifiedKey  = "lastModifiedDate";
constexpr const char* kHashKey          = "hash";
constexpr const char* kNameKey          = "name";
constexpr const char* kCreationDateKey  = "creationDate";
constexpr const char* kArchiveExtension = ".jwlibrary";

const Value* Field(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  return it == object.fields().end() ? nullptr : &it->second;
}

std::string StringOr(const Struct& object, const std::string& key, const std::string& fallback) {
  const Value* value = Field(object, key);
  if (value == nullptr || value->kind_case() != Value::kStringValue) return fallback;
  return value->string_value();
}

void SetString(Struct* object, const std::string& key, const std::string& text) {
  (*object->mutable_fields())[key].set_string_value(text);
}

util::TimePoint ParseTimestamp(const std::string& text, const char* which, Phase phase) {
  auto parsed = util::ParseIso8601(text);
  if (!parsed) throw IncompatibleInput(phase, std::string("Unparseable ") + which + " lastModifiedDate: " + text);
  return *parsed;
}

} // namespace

Manifest Manifest::Parse(const std::string& json, Phase phase) {
  Struct root;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &root);
  if (!status.ok()) {
    throw IncompatibleInput(phase, "Malformed manifest: " + std::string(status.message()));
  }

  const Value* backup = Field(root, kBackupKey);
  if (backup == nullptr || backup->kind_case() != Value::kStructValue) {
    throw IncompatibleInput(phase, "Manifest has no userDataBackup section");
  }

  const Value* version = Field(backup->struct_value(), kSchemaVersionKey);
  if (version == nullptr || version->kind_case() == Value::KIND_NOT_SET || version->kind_case() == Value::kNullValue) {
    throw IncompatibleInput(phase, "Manifest does not declare a schemaVersion");
  }

  return Manifest(std::move(root));
}

Manifest Manifest::Load(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw IncompatibleInput(Phase::Validate, "Missing manifest file: " + path.filename().string());
  }
  auto bytes = util::ReadFileBytes(path, Phase::Validate);
  return Parse(std::string(bytes.begin(), bytes.end()));
}

std::string Manifest::ToJson() const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root_, &json, options);
  if (!status.ok()) {
    throw util::IOFailure(Phase::Finalize, "Failed to serialize manifest: " + std::string(status.message()));
  }
  return json;
}

void Manifest::Save(const std::filesystem::path& path) const {
  const auto json = ToJson();
  util::WriteFileBytes(path, std::vector<std::uint8_t>(json.begin(), json.end()), Phase::Finalize);
}

const Value& Manifest::SchemaVersion() const {
  return *Field(Backup(), kSchemaVersionKey);
}

std::string Manifest::SchemaVersionText() const {
  const Value& version = SchemaVersion();
  switch (version.kind_case()) {
    case Value::kNumberValue: {
      const double number = version.number_value();
      if (number == static_cast<double>(static_cast<std::int64_t>(number))) return std::to_string(static_cast<std::int64_t>(number));
      return std::to_string(number);
    }
    case Value::kStringValue:
      return version.string_value();
    case Value::kBoolValue:
      return version.bool_value() ? "true" : "false";
    default:
      break;
  }
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(version, &json);
  return status.ok() ? json : "?";
}

std::string Manifest::DatabaseName(const std::string& fallback) const {
  auto name = StringOr(Backup(), kDatabaseNameKey, "");
  return name.empty() ? fallback : name;
}

std::optional<std::string> Manifest::LastModified() const {
  const Value* value = Field(Backup(), kLastModifiedKey);
  if (value == nullptr || value->kind_case() != Value::kStringValue) return std::nullopt;
  return value->string_value();
}

std::string Manifest::Name() const {
  return StringOr(root_, kNameKey, "");
}

std::string Manifest::CreationDate() const {
  return StringOr(root_, kCreationDateKey, "");
}

std::string Manifest::Hash() const {
  return StringOr(Backup(), kHashKey, "");
}

void Manifest::SetHash(const std::string& hash) {
  SetString(MutableBackup(), kHashKey, hash);
}

void Manifest::SetLastModified(const std::string& timestamp) {
  SetString(MutableBackup(), kLastModifiedKey, timestamp);
}

void Manifest::SetCreationDate(const std::string& timestamp) {
  SetString(&root_, kCreationDateKey, timestamp);
}

void Manifest::SetName(const std::string& name) {
  SetString(&root_, kNameKey, name);
}

const Struct& Manifest::Backup() const {
  return Field(root_, kBackupKey)->struct_value();
}

Struct* Manifest::MutableBackup() {
  return (*root_.mutable_fields())[kBackupKey].mutable_struct_value();
}

void ValidateCompatible(const Manifest& source, const Manifest& destination) {
  if (!google::protobuf::util::MessageDifferencer::Equals(source.SchemaVersion(), destination.SchemaVersion())) {
    JWLMERGE_LOG_ERROR("Schema versions do not match",
                       {StringField("source", source.SchemaVersionText()), StringField("destination", destination.SchemaVersionText())});
    throw IncompatibleInput(Phase::Validate, "Schema versions do not match (source " + source.SchemaVersionText() + ", destination " +
                                                 destination.SchemaVersionText() + ")");
  }

  if (auto text = source.LastModified()) ParseTimestamp(*text, "source", Phase::Validate);
  if (auto text = destination.LastModified()) ParseTimestamp(*text, "destination", Phase::Validate);
}

void ApplyMergeUpdates(Manifest* destination, const Manifest& source, const std::string& hash, util::TimePoint now) {
  destination->SetHash(hash);

  const auto source_modified      = source.LastModified();
  const auto destination_modified = destination->LastModified();
  if (source_modified) {
    // ties keep the destination value
    if (!destination_modified || ParseTimestamp(*source_modified, "source", Phase::Finalize) >
                                     ParseTimestamp(*destination_modified, "destination", Phase::Finalize)) {
      destination->SetLastModified(*source_modified);
    }
  }

  destination->SetCreationDate(util::FormatLocalIso8601(now));
  destination->SetName(util::MergedBackupName(now) + kArchiveExtension);
}

} // namespace jwlmerge::manifest
