#include <showlink/index_store.h>

#include <showlink/log_line_codec.h>
#include <showlink/models.h>
#include <showlink/tree_walk.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace showlink {

std::string IndexKey(const std::filesystem::path &path) {
  auto normalized = path.lexically_normal();
  if (!normalized.has_filename() && normalized.has_relative_path()) {
    normalized = normalized.parent_path();
  }
  return normalized.string();
}

LogBackedIndexStore::LogBackedIndexStore(std::filesystem::path log_directory,
                                         std::shared_ptr<Logger> logger)
    : log_directory_(std::move(log_directory)),
      logger_(EnsureLogger(std::move(logger))) {
  std::error_code ec;
  std::filesystem::create_directories(log_directory_, ec);
  if (ec) {
    throw ConfigurationError("Cannot create log directory " +
                             log_directory_.string() + ": " + ec.message());
  }
  LoadSkippedArchives();
}

std::filesystem::path LogBackedIndexStore::FolderLogPath() const {
  return log_directory_ / kFolderLogName;
}

std::filesystem::path LogBackedIndexStore::LinkLogPath() const {
  return log_directory_ / kLinkLogName;
}

std::filesystem::path LogBackedIndexStore::SkippedArchiveLogPath() const {
  return log_directory_ / kSkippedArchiveLogName;
}

void LogBackedIndexStore::LoadSkippedArchives() {
  const auto path = SkippedArchiveLogPath();
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream stream(path);
  if (!stream) {
    logger_->Log(LogLevel::kWarn, "index.log.unreadable",
                 {{"path", path.string()}});
    return;
  }
  std::string line;
  while (std::getline(stream, line)) {
    if (line.empty()) {
      continue;
    }
    skipped_archives_.insert(IndexKey(DecodePath(line)));
  }
  logger_->Log(LogLevel::kDebug, "index.skipped_archives.loaded",
               {{"path", path.string()},
                {"count", std::to_string(skipped_archives_.size())}});
}

void LogBackedIndexStore::RewriteLog(
    const std::filesystem::path &log_path,
    const std::vector<std::filesystem::path> &entries) const {
  std::ofstream stream(log_path, std::ios::trunc);
  if (!stream) {
    logger_->Log(LogLevel::kWarn, "index.log.unwritable",
                 {{"path", log_path.string()}});
    return;
  }
  for (const auto &entry : entries) {
    stream << EncodePath(entry) << '\n';
  }
}

void LogBackedIndexStore::AppendLog(const std::filesystem::path &log_path,
                                    const std::filesystem::path &entry) const {
  std::ofstream stream(log_path, std::ios::app);
  if (!stream) {
    logger_->Log(LogLevel::kWarn, "index.log.unwritable",
                 {{"path", log_path.string()}});
    return;
  }
  stream << EncodePath(entry) << '\n';
}

std::set<std::filesystem::path> LogBackedIndexStore::RebuildFolderIndex(
    const std::filesystem::path &destination_root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(destination_root, ec)) {
    throw ConfigurationError("Destination directory '" +
                             destination_root.string() + "' does not exist.");
  }

  std::set<std::filesystem::path> folders;
  std::filesystem::directory_iterator iterator(destination_root, ec);
  if (ec) {
    throw ConfigurationError("Cannot list destination directory '" +
                             destination_root.string() +
                             "': " + ec.message());
  }
  for (const auto &entry : iterator) {
    std::error_code entry_ec;
    if (entry.is_symlink(entry_ec) || !entry.is_directory(entry_ec)) {
      continue;
    }
    folders.insert(entry.path());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  folder_order_.assign(folders.begin(), folders.end());
  folders_.clear();
  for (const auto &folder : folder_order_) {
    folders_.insert(IndexKey(folder));
  }
  RewriteLog(FolderLogPath(), folder_order_);
  logger_->Log(LogLevel::kInfo, "index.folders.rebuilt",
               {{"destination", destination_root.string()},
                {"count", std::to_string(folders.size())},
                {"log", FolderLogPath().string()}});
  return folders;
}

std::set<std::filesystem::path> LogBackedIndexStore::RebuildLinkIndex(
    const std::filesystem::path &destination_root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(destination_root, ec)) {
    throw ConfigurationError("Destination directory '" +
                             destination_root.string() + "' does not exist.");
  }

  std::filesystem::directory_iterator root_listing(
      destination_root,
      std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw ConfigurationError("Cannot walk destination directory '" +
                             destination_root.string() +
                             "': " + ec.message());
  }

  std::set<std::filesystem::path> targets;
  for (const auto &entry : ListTree(destination_root, *logger_)) {
    std::error_code entry_ec;
    if (!entry.is_symlink(entry_ec)) {
      continue;
    }
    const auto target =
        std::filesystem::weakly_canonical(entry.path(), entry_ec);
    if (entry_ec) {
      logger_->Log(LogLevel::kWarn, "index.links.unresolvable",
                   {{"link", entry.path().string()},
                    {"error", entry_ec.message()}});
      continue;
    }
    targets.insert(target);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  link_targets_.clear();
  for (const auto &target : targets) {
    link_targets_.insert(IndexKey(target));
  }
  RewriteLog(LinkLogPath(),
             std::vector<std::filesystem::path>(targets.begin(), targets.end()));
  logger_->Log(LogLevel::kInfo, "index.links.rebuilt",
               {{"destination", destination_root.string()},
                {"count", std::to_string(targets.size())},
                {"log", LinkLogPath().string()}});
  return targets;
}

bool LogBackedIndexStore::IsKnownFolder(
    const std::filesystem::path &folder) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return folders_.count(IndexKey(folder)) != 0;
}

std::vector<std::filesystem::path> LogBackedIndexStore::KnownFolders() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return folder_order_;
}

bool LogBackedIndexStore::RecordNewFolder(const std::filesystem::path &folder) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!folders_.insert(IndexKey(folder)).second) {
    return false;
  }
  folder_order_.push_back(folder);
  AppendLog(FolderLogPath(), folder);
  return true;
}

bool LogBackedIndexStore::IsLinkTarget(
    const std::filesystem::path &target) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return link_targets_.count(IndexKey(target)) != 0;
}

bool LogBackedIndexStore::ClaimLinkTarget(const std::filesystem::path &target) {
  std::lock_guard<std::mutex> lock(mutex_);
  return link_targets_.insert(IndexKey(target)).second;
}

void LogBackedIndexStore::CommitLinkTarget(
    const std::filesystem::path &target) {
  std::lock_guard<std::mutex> lock(mutex_);
  AppendLog(LinkLogPath(), target);
}

void LogBackedIndexStore::ReleaseLinkTarget(
    const std::filesystem::path &target) {
  std::lock_guard<std::mutex> lock(mutex_);
  link_targets_.erase(IndexKey(target));
}

bool LogBackedIndexStore::IsArchiveSkipped(
    const std::filesystem::path &archive) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return skipped_archives_.count(IndexKey(archive)) != 0;
}

bool LogBackedIndexStore::RecordSkippedArchive(
    const std::filesystem::path &archive) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!skipped_archives_.insert(IndexKey(archive)).second) {
    return false;
  }
  AppendLog(SkippedArchiveLogPath(), archive);
  return true;
}

} // namespace showlink
