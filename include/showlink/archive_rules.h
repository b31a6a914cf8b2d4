#pragma once

#include <filesystem>

namespace showlink {

bool IsMultipartArchive(const std::filesystem::path &path);

} // namespace showlink
