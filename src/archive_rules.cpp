#include <showlink/archive_rules.h>

#include <regex>
#include <string>

namespace showlink {

bool IsMultipartArchive(const std::filesystem::path &path) {
  static const std::regex kArchiveExtension("^\\.(rar|r[0-9]{2,3})$",
                                            std::regex::icase);
  const auto extension = path.filename().extension().string();
  if (extension.empty()) {
    return false;
  }
  return std::regex_match(extension, kArchiveExtension);
}

} // namespace showlink
