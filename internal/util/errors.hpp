#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace jwlmerge::util {

/*
  Central error types.

  Every failure of a merge run surfaces as exactly one of these.
  Phase tells the caller where the run stopped.
*/

enum class Phase {
  Extract,
  Validate,
  Merge,
  Finalize,
  Pack
};

inline const char* ToString(Phase phase) {
  switch (phase) {
    case Phase::Extract:
      return "extract";
    case Phase::Validate:
      return "validate";
    case Phase::Merge:
      return "merge";
    case Phase::Finalize:
      return "finalize";
    case Phase::Pack:
      return "pack";
  }
  return "unknown";
}

class MergeError : public std::runtime_error {
 public:
  MergeError(Phase phase, const std::string& msg) : std::runtime_error(msg), phase_(phase) {
  }

  Phase phase() const {
    return phase_;
  }

  virtual const char* kind() const = 0;

 private:
  Phase phase_;
};

// Schema versions differ, or a store/manifest is missing or malformed.
class IncompatibleInput : public MergeError {
 public:
  IncompatibleInput(Phase phase, const std::string& msg) : MergeError(phase, msg) {
  }

  const char* kind() const override {
    return "IncompatibleInput";
  }
};

// One entity kind could not be merged.
class MergeFailure : public MergeError {
 public:
  MergeFailure(std::string entity, db::ErrorCode cause, const std::string& msg)
      : MergeError(Phase::Merge, "Error merging table " + entity + ": " + msg), entity_(std::move(entity)), cause_(cause) {
  }

  const char* kind() const override {
    return "MergeFailure";
  }

  const std::string& entity() const {
    return entity_;
  }

  db::ErrorCode cause() const {
    return cause_;
  }

 private:
  std::string   entity_;
  db::ErrorCode cause_;
};

// The destination transaction as a whole was rejected.
class ConstraintViolation : public MergeError {
 public:
  explicit ConstraintViolation(const std::string& msg) : MergeError(Phase::Merge, "Database constraint violation: " + msg) {
  }

  const char* kind() const override {
    return "ConstraintViolation";
  }
};

// Archive or store file I/O unrelated to merge logic.
class IOFailure : public MergeError {
 public:
  IOFailure(Phase phase, const std::string& msg) : MergeError(phase, msg) {
  }

  const char* kind() const override {
    return "IOFailure";
  }
};

} // namespace jwlmerge::util
