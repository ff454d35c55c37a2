#include "internal/archive/zip_archive.hpp"

#include <miniz.h>

#include <algorithm>
#include <ctime>
#include <set>

#include "internal/util/errors.hpp"

namespace jwlmerge::archive {

using util::IOFailure;
using util::Phase;

namespace {

constexpr std::uint32_t kModeTypeMask = 0170000;
constexpr std::uint32_t kModeSymlink  = 0120000;

// Owns an initialized mz_zip_archive and ends it on scope exit.
class ZipHandle {
public:
  ZipHandle() { mz_zip_zero_struct(&zip_); }
  ~ZipHandle() { mz_zip_end(&zip_); }

  ZipHandle(const ZipHandle&)            = delete;
  ZipHandle& operator=(const ZipHandle&) = delete;

  mz_zip_archive* get() { return &zip_; }

  std::string LastError() { return mz_zip_get_error_string(mz_zip_get_last_error(&zip_)); }

private:
  mz_zip_archive zip_;
};

// 1980-01-01 00:00:00 local time, the DOS epoch. miniz converts through
// localtime, so every entry gets the same DOS date and time fields.
MZ_TIME_T DosEpoch() {
  std::tm tm{};
  tm.tm_year  = 80;
  tm.tm_mon   = 0;
  tm.tm_mday  = 1;
  tm.tm_isdst = -1;
  return std::mktime(&tm);
}

} // namespace

std::string SanitizeEntryPath(const std::string& raw) {
  auto reject = [&raw](const char* why) { return IOFailure(Phase::Extract, "unsafe entry path '" + raw + "': " + why); };

  if (raw.empty()) throw reject("empty");
  if (raw.find('\0') != std::string::npos) throw reject("NUL byte");
  if (raw.find('\\') != std::string::npos) throw reject("backslash");
  if (raw.front() == '/') throw reject("absolute");
  if (raw.size() >= 2 && raw[1] == ':') throw reject("drive letter");

  std::string normalized;
  std::size_t start = 0;
  while (start <= raw.size()) {
    std::size_t end = raw.find('/', start);
    if (end == std::string::npos) end = raw.size();
    const std::string part = raw.substr(start, end - start);
    start = end + 1;

    if (part.empty() || part == ".") continue;
    if (part == "..") throw reject("parent reference");
    if (!normalized.empty()) normalized += '/';
    normalized += part;
  }
  if (normalized.empty()) throw reject("no name");
  return normalized;
}

std::vector<ZipEntry> ReadZip(const std::vector<std::uint8_t>& archive, const ZipLimits& limits) {
  ZipHandle zip;
  if (!mz_zip_reader_init_mem(zip.get(), archive.data(), archive.size(), 0)) {
    throw IOFailure(Phase::Extract, "not a zip archive: " + zip.LastError());
  }

  const mz_uint         count = mz_zip_reader_get_num_files(zip.get());
  std::vector<ZipEntry> entries;
  std::set<std::string> seen;
  entries.reserve(count);

  for (mz_uint i = 0; i < count; ++i) {
    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(zip.get(), i, &stat)) {
      throw IOFailure(Phase::Extract, "corrupt archive: " + zip.LastError());
    }
    const std::string raw_name = stat.m_filename;

    if (stat.m_is_encrypted) throw IOFailure(Phase::Extract, "encrypted entry: " + raw_name);
    if (!stat.m_is_supported) throw IOFailure(Phase::Extract, "unsupported entry: " + raw_name);
    if (((stat.m_external_attr >> 16) & kModeTypeMask) == kModeSymlink) {
      throw IOFailure(Phase::Extract, "symlink entries are not permitted: " + raw_name);
    }
    if (stat.m_uncomp_size > limits.max_entry_bytes) {
      throw IOFailure(Phase::Extract, "entry exceeds size limit: " + raw_name);
    }

    ZipEntry entry;
    entry.is_directory = stat.m_is_directory != 0;
    entry.path         = SanitizeEntryPath(raw_name);
    if (!seen.insert(entry.path).second) {
      throw IOFailure(Phase::Extract, "duplicate entry: " + entry.path);
    }

    if (!entry.is_directory && stat.m_uncomp_size > 0) {
      entry.data.resize(static_cast<std::size_t>(stat.m_uncomp_size));
      // verifies the stored crc32
      if (!mz_zip_reader_extract_to_mem(zip.get(), i, entry.data.data(), entry.data.size(), 0)) {
        throw IOFailure(Phase::Extract, "corrupt archive: " + entry.path + ": " + zip.LastError());
      }
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<std::uint8_t> WriteZip(std::vector<ZipEntry> entries, int level) {
  if (level < 0 || level > 9) {
    throw IOFailure(Phase::Pack, "compression level out of range: " + std::to_string(level));
  }

  std::sort(entries.begin(), entries.end(), [](const ZipEntry& a, const ZipEntry& b) { return a.path < b.path; });

  ZipHandle zip;
  if (!mz_zip_writer_init_heap(zip.get(), 0, 0)) {
    throw IOFailure(Phase::Pack, "cannot create zip archive: " + zip.LastError());
  }

  MZ_TIME_T mtime = DosEpoch();
  for (const auto& entry : entries) {
    const std::string name = entry.is_directory ? entry.path + "/" : entry.path;
    const void*       data = entry.is_directory || entry.data.empty() ? nullptr : entry.data.data();
    const std::size_t size = entry.is_directory ? 0 : entry.data.size();

    if (!mz_zip_writer_add_mem_ex_v2(zip.get(), name.c_str(), data, size, nullptr, 0, static_cast<mz_uint>(level), 0, 0, &mtime,
                                     nullptr, 0, nullptr, 0)) {
      throw IOFailure(Phase::Pack, "cannot add " + entry.path + ": " + zip.LastError());
    }
  }

  void*       buffer = nullptr;
  std::size_t length = 0;
  if (!mz_zip_writer_finalize_heap_archive(zip.get(), &buffer, &length)) {
    throw IOFailure(Phase::Pack, "cannot finalize zip archive: " + zip.LastError());
  }
  const auto* bytes = static_cast<const std::uint8_t*>(buffer);
  std::vector<std::uint8_t> out(bytes, bytes + length);
  mz_free(buffer);
  return out;
}

} // namespace jwlmerge::archive
