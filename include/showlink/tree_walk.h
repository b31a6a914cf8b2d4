#pragma once

#include <showlink/logging.h>

#include <filesystem>
#include <vector>

namespace showlink {

// Directory symlinks are listed but not descended into.
std::vector<std::filesystem::directory_entry>
ListTree(const std::filesystem::path &root, Logger &logger);

} // namespace showlink
