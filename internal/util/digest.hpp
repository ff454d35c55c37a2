#pragma once

#include <filesystem>
#include <string>

namespace jwlmerge::util {

// Lower-case hex SHA-256 of a file's bytes. Throws IOFailure (finalize phase) if unreadable.
std::string Sha256File(const std::filesystem::path& path);

} // namespace jwlmerge::util
