#include "file_io.hpp"

#include <fstream>
#include <iterator>

namespace jwlmerge::util {

std::vector<std::uint8_t> ReadFileBytes(const std::filesystem::path& path, Phase phase) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IOFailure(phase, "cannot open " + path.string());
  }
  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw IOFailure(phase, "read failed: " + path.string());
  }
  return data;
}

void WriteFileBytes(const std::filesystem::path& path, const std::vector<std::uint8_t>& data, Phase phase) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw IOFailure(phase, "cannot create " + path.string());
  }
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out) {
    throw IOFailure(phase, "write failed: " + path.string());
  }
}

} // namespace jwlmerge::util
