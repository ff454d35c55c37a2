#include "internal/archive/workspace.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/uuid.hpp"

namespace jwlmerge::archive {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;
using util::IOFailure;
using util::Phase;

namespace {

bool IsWithin(const fs::path& root, const fs::path& candidate) {
  auto r = root.lexically_normal();
  auto c = candidate.lexically_normal();
  auto mismatch = std::mismatch(r.begin(), r.end(), c.begin(), c.end());
  // a trailing empty element means root ended with a separator
  return mismatch.first == r.end() || (std::next(mismatch.first) == r.end() && mismatch.first->empty());
}

} // namespace

Workspace Workspace::Create(const fs::path& temp_root) {
  std::error_code ec;
  fs::path        base = temp_root;
  if (base.empty()) {
    base = fs::temp_directory_path(ec);
    if (ec) throw IOFailure(Phase::Extract, "no temp directory: " + ec.message());
  }

  fs::path root = base / ("jwlmerge-" + util::ToString(util::GenerateUUID()));
  fs::create_directories(root / "source", ec);
  if (!ec) fs::create_directories(root / "destination", ec);
  if (ec) {
    std::error_code ignored;
    fs::remove_all(root, ignored);
    throw IOFailure(Phase::Extract, "cannot create workspace " + root.string() + ": " + ec.message());
  }

  JWLMERGE_LOG_DEBUG("Created workspace", {StringField("path", root.string())});
  return Workspace(std::move(root));
}

Workspace::~Workspace() {
  Release();
}

Workspace::Workspace(Workspace&& other) noexcept : root_(std::exchange(other.root_, {})) {
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
  if (this != &other) {
    Release();
    root_ = std::exchange(other.root_, {});
  }
  return *this;
}

void Workspace::Release() noexcept {
  if (root_.empty()) return;

  std::uintmax_t  bytes = 0;
  std::int64_t    files = 0;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code size_ec;
    if (it->is_regular_file(size_ec)) {
      ++files;
      auto size = it->file_size(size_ec);
      if (!size_ec) bytes += size;
    }
  }

  ec.clear();
  fs::remove_all(root_, ec);
  if (ec) {
    JWLMERGE_LOG_WARN("Could not remove workspace; remove it manually", {StringField("path", root_.string()), StringField("error", ec.message())});
  } else {
    JWLMERGE_LOG_INFO("Cleaned up workspace", {IntField("files", files), IntField("bytes", static_cast<std::int64_t>(bytes))});
  }
  root_.clear();
}

std::vector<std::string> Unpack(const std::vector<std::uint8_t>& archive, const fs::path& dir, const ZipLimits& limits) {
  auto entries = ReadZip(archive, limits);

  std::error_code ec;
  const fs::path  root = fs::weakly_canonical(dir, ec);
  if (ec) throw IOFailure(Phase::Extract, "bad extraction root " + dir.string() + ": " + ec.message());

  std::vector<std::string> written;
  for (auto& entry : entries) {
    const fs::path target = root / fs::path(entry.path);
    if (!IsWithin(root, target)) {
      throw IOFailure(Phase::Extract, "entry escapes workspace: " + entry.path);
    }

    if (entry.is_directory) {
      fs::create_directories(target, ec);
      if (ec) throw IOFailure(Phase::Extract, "cannot create directory " + entry.path + ": " + ec.message());
      continue;
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) throw IOFailure(Phase::Extract, "cannot create parent for " + entry.path + ": " + ec.message());

    util::WriteFileBytes(target, entry.data, Phase::Extract);
    written.push_back(entry.path);
  }
  return written;
}

std::vector<std::uint8_t> Pack(const fs::path& dir, int level) {
  std::vector<ZipEntry> entries;
  std::error_code       ec;

  for (fs::recursive_directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || it->is_symlink(type_ec)) continue;

    ZipEntry entry;
    entry.path = it->path().lexically_relative(dir).generic_string();
    entry.data = util::ReadFileBytes(it->path(), Phase::Pack);
    entries.push_back(std::move(entry));
  }
  if (ec) throw IOFailure(Phase::Pack, "cannot walk " + dir.string() + ": " + ec.message());

  return WriteZip(std::move(entries), level);
}

} // namespace jwlmerge::archive
