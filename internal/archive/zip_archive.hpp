#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jwlmerge::archive {

/*
  In-memory ZIP read and write over miniz.

  Read: entries miniz can decode; encrypted or unsupported entries,
  symlinks, duplicate names and CRC mismatches are rejected. Write:
  entries sorted by path, a fixed 1980-01-01 timestamp and one
  compression level, so equal inputs give byte-identical archives.

  Errors throw util::IOFailure (extract phase for reads, pack for writes).
*/

struct ZipEntry {
  // '/'-separated, relative, already validated by SanitizeEntryPath
  std::string               path;
  std::vector<std::uint8_t> data;
  bool                      is_directory = false;
};

struct ZipLimits {
  std::uint64_t max_entry_bytes = 1ull << 30;
};

std::vector<ZipEntry> ReadZip(const std::vector<std::uint8_t>& archive, const ZipLimits& limits = {});

// level 0 stores entries uncompressed; 1-9 deflates
std::vector<std::uint8_t> WriteZip(std::vector<ZipEntry> entries, int level = 6);

/*
  Normalizes an entry name to a relative '/'-separated path.

  Rejects names that could land outside the extraction root: absolute
  paths, drive letters, backslashes, NUL bytes, ".." components, and
  names that are empty after dropping "." and empty components.
*/
std::string SanitizeEntryPath(const std::string& raw);

} // namespace jwlmerge::archive
