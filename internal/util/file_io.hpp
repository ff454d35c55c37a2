#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "internal/util/errors.hpp"

namespace jwlmerge::util {

// Whole-file helpers; failures throw IOFailure tagged with the given phase.
std::vector<std::uint8_t> ReadFileBytes(const std::filesystem::path& path, Phase phase);
void                      WriteFileBytes(const std::filesystem::path& path, const std::vector<std::uint8_t>& data, Phase phase);

} // namespace jwlmerge::util
