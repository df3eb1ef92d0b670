#include "path_utils.hpp"

#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace jobq::util {

std::filesystem::path ExpandUserPath(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    // ~user form is not supported
    return path;
  }

  const char* home = std::getenv("HOME");
  if (!home || !*home) {
    throw std::runtime_error("cannot expand '" + path + "': HOME is not set");
  }
  return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
}

void EnsureParentDirectory(const std::filesystem::path& file) {
  const auto parent = file.parent_path();
  if (parent.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("failed to create directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace jobq::util
