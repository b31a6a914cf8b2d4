#pragma once

#include <filesystem>
#include <string>

namespace showlink {

std::string EscapeLogLine(const std::string &value);
std::string UnescapeLogLine(const std::string &value);

std::string EncodePath(const std::filesystem::path &path);
std::filesystem::path DecodePath(const std::string &line);

} // namespace showlink
