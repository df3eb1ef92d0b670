#pragma once

#include <filesystem>
#include <string>

namespace jobq::util {

// Replaces a leading "~" with $HOME. Other paths are returned unchanged.
std::filesystem::path ExpandUserPath(const std::string& path);

// Creates the parent directory of `file` if missing. Throws std::runtime_error.
void EnsureParentDirectory(const std::filesystem::path& file);

} // namespace jobq::util
