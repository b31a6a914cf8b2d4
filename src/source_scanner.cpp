#include <showlink/source_scanner.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace showlink {

SourceScanner::SourceScanner(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<SourceEntry>
SourceScanner::ScanRoot(const std::filesystem::path &source_root) const {
  std::error_code ec;
  const auto root = std::filesystem::absolute(source_root, ec);
  if (ec || !std::filesystem::is_directory(root, ec)) {
    throw ConfigurationError("Source directory '" + source_root.string() +
                             "' does not exist.");
  }

  std::vector<std::filesystem::path> children;
  std::filesystem::directory_iterator iterator(root, ec);
  if (ec) {
    throw ConfigurationError("Cannot list source directory '" +
                             root.string() + "': " + ec.message());
  }
  for (const auto &child : iterator) {
    children.push_back(child.path());
  }
  std::sort(children.begin(), children.end());

  std::vector<SourceEntry> entries;
  for (const auto &child : children) {
    std::error_code status_ec;
    if (std::filesystem::is_directory(child, status_ec)) {
      entries.push_back({child, EntryKind::kFolder, {}});
    } else if (std::filesystem::is_regular_file(child, status_ec)) {
      entries.push_back({child, EntryKind::kLooseFile, {}});
    } else {
      logger_->Log(LogLevel::kDebug, "scan.ignored", {{"path", child.string()}});
    }
  }

  logger_->Log(LogLevel::kInfo, "scan.complete",
               {{"source", root.string()},
                {"entries", std::to_string(entries.size())}});
  return entries;
}

SourceEntry
SourceScanner::EntryForTarget(const std::filesystem::path &target) const {
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(target, ec);
  if (ec) {
    throw std::invalid_argument("Cannot resolve path: " + target.string());
  }
  // "Show/" must name the folder, not an empty filename.
  const auto normalized = absolute.lexically_normal();
  const auto path = normalized.has_filename() ? normalized
                                              : normalized.parent_path();

  if (std::filesystem::is_directory(path, ec)) {
    logger_->Log(LogLevel::kInfo, "scan.target",
                 {{"path", path.string()}, {"mode", "folder"}});
    return SourceEntry{path, EntryKind::kFolder, {}};
  }
  if (std::filesystem::is_regular_file(path, ec)) {
    logger_->Log(LogLevel::kInfo, "scan.target",
                 {{"path", path.string()}, {"mode", "file"}});
    return SourceEntry{path.parent_path(), EntryKind::kFile,
                       path.filename().string()};
  }
  throw std::invalid_argument("The provided argument is neither a file nor a "
                              "directory: " +
                              target.string());
}

} // namespace showlink
