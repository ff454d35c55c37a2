#pragma once

#include <google/protobuf/struct.pb.h>

#include <filesystem>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jwlmerge::manifest {

/*
  Backup manifest (manifest.json).

  Held as a protobuf Struct so keys this code never touches survive a
  rewrite. Construction requires an object with a userDataBackup object
  that declares schemaVersion; anything else is IncompatibleInput.
*/
class Manifest {
 public:
  static Manifest Parse(const std::string& json, util::Phase phase = util::Phase::Validate);
  static Manifest Load(const std::filesystem::path& path);

  std::string ToJson() const;
  void        Save(const std::filesystem::path& path) const;

  const google::protobuf::Value& SchemaVersion() const;
  std::string                    SchemaVersionText() const;

  // userDataBackup.databaseName, or fallback when absent or empty
  std::string DatabaseName(const std::string& fallback) const;

  std::optional<std::string> LastModified() const;
  std::string                Name() const;
  std::string                CreationDate() const;
  std::string                Hash() const;

  void SetHash(const std::string& hash);
  void SetLastModified(const std::string& timestamp);
  void SetCreationDate(const std::string& timestamp);
  void SetName(const std::string& name);

  const google::protobuf::Struct& Root() const {
    return root_;
  }

 private:
  explicit Manifest(google::protobuf::Struct root) : root_(std::move(root)) {
  }

  const google::protobuf::Struct& Backup() const;
  google::protobuf::Struct*       MutableBackup();

  google::protobuf::Struct root_;
};

// Throws IncompatibleInput if the schema versions differ or a lastModifiedDate is unparseable.
void ValidateCompatible(const Manifest& source, const Manifest& destination);

/*
  Post-merge rewrite of the destination manifest:
  hash <- digest of the merged store; lastModifiedDate <- source value
  only if strictly later; creationDate <- now; name <- merged_<date>_<time>.jwlibrary.
*/
void ApplyMergeUpdates(Manifest* destination, const Manifest& source, const std::string& hash, util::TimePoint now);

} // namespace jwlmerge::manifest
