#include <showlink/tree_walk.h>

#include <system_error>
#include <utility>

namespace showlink {

std::vector<std::filesystem::directory_entry>
ListTree(const std::filesystem::path &root, Logger &logger) {
  std::vector<std::filesystem::directory_entry> entries;
  std::vector<std::filesystem::path> pending{root};
  while (!pending.empty()) {
    const std::filesystem::path directory = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    std::filesystem::directory_iterator it(
        directory, std::filesystem::directory_options::skip_permission_denied,
        ec);
    const std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
      const auto &entry = *it;
      entries.push_back(entry);
      std::error_code entry_ec;
      if (!entry.is_symlink(entry_ec) && entry.is_directory(entry_ec)) {
        pending.push_back(entry.path());
      }
    }
    if (ec) {
      logger.Log(LogLevel::kWarn, "tree.walk_error",
                 {{"directory", directory.string()}, {"error", ec.message()}});
    }
  }
  return entries;
}

} // namespace showlink
