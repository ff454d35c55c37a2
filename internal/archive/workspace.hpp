#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/archive/zip_archive.hpp"

namespace jwlmerge::archive {

/*
  Per-run scratch directory: <temp_root>/jwlmerge-<uuid>/{source,destination}.

  Removed (recursively) when the Workspace is destroyed, on success and
  on failure alike. Move-only.
*/
class Workspace {
 public:
  // Empty temp_root means std::filesystem::temp_directory_path(). Throws IOFailure.
  static Workspace Create(const std::filesystem::path& temp_root = {});

  ~Workspace();

  Workspace(Workspace&& other) noexcept;
  Workspace& operator=(Workspace&& other) noexcept;

  Workspace(const Workspace&)            = delete;
  Workspace& operator=(const Workspace&) = delete;

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path SourceDir() const {
    return root_ / "source";
  }

  std::filesystem::path DestinationDir() const {
    return root_ / "destination";
  }

  // Removes the tree now; also done by the destructor. Never throws.
  void Release() noexcept;

 private:
  explicit Workspace(std::filesystem::path root) : root_(std::move(root)) {
  }

  std::filesystem::path root_;
};

/*
  Writes every archive entry under dir. Returns the relative paths of the
  files written. An entry whose resolved path would leave dir is rejected
  with IOFailure before anything is written for it.
*/
std::vector<std::string> Unpack(const std::vector<std::uint8_t>& archive, const std::filesystem::path& dir, const ZipLimits& limits = {});

// Every regular file under dir, paths relative to dir, deterministic order.
std::vector<std::uint8_t> Pack(const std::filesystem::path& dir, int level = 6);

} // namespace jwlmerge::archive
