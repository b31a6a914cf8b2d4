#include <showlink/cleanup_job.h>

#include <showlink/archive_rules.h>
#include <showlink/tree_walk.h>

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace showlink {
namespace {

std::size_t Depth(const std::filesystem::path &path) {
  return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

} // namespace

CleanupJob::CleanupJob(std::filesystem::path destination_root,
                       CleanupOptions options, std::shared_ptr<Logger> logger)
    : root_(std::move(destination_root)), options_(options),
      logger_(EnsureLogger(std::move(logger))) {}

bool CleanupJob::Remove(const std::filesystem::path &path, const char *event) {
  std::error_code ec;
  if (!std::filesystem::remove(path, ec)) {
    if (ec) {
      logger_->Log(LogLevel::kWarn, "cleanup.remove_failed",
                   {{"path", path.string()}, {"error", ec.message()}});
    }
    return false;
  }
  logger_->Log(LogLevel::kDebug, event, {{"path", path.string()}});
  return true;
}

bool CleanupJob::TargetMissing(const std::filesystem::path &link) {
  std::error_code ec;
  const auto target = std::filesystem::status(link, ec);
  if (!ec) {
    return target.type() == std::filesystem::file_type::not_found;
  }
  if (ec == std::errc::no_such_file_or_directory ||
      ec == std::errc::not_a_directory) {
    return true;
  }
  logger_->Log(LogLevel::kWarn, "cleanup.link_unverifiable",
               {{"path", link.string()}, {"error", ec.message()}});
  return false;
}

void CleanupJob::RemoveArchivesAndBrokenLinks(CleanupSummary &summary) {
  for (const auto &entry : ListTree(root_, *logger_)) {
    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec) {
      continue;
    }
    const bool is_link = std::filesystem::is_symlink(status);
    if ((is_link || std::filesystem::is_regular_file(status)) &&
        IsMultipartArchive(entry.path())) {
      if (Remove(entry.path(), "cleanup.archive_removed")) {
        ++summary.archives_removed;
      }
      continue;
    }
    if (options_.prune_broken_links && is_link &&
        TargetMissing(entry.path())) {
      if (Remove(entry.path(), "cleanup.broken_link_removed")) {
        logger_->Log(LogLevel::kInfo, "cleanup.broken_link",
                     {{"path", entry.path().string()}});
        ++summary.broken_links_removed;
      }
    }
  }
}

std::size_t CleanupJob::RemoveEmptyDirectories() {
  std::size_t removed = 0;
  while (true) {
    std::vector<std::filesystem::path> directories;
    for (const auto &entry : ListTree(root_, *logger_)) {
      std::error_code ec;
      if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
        directories.push_back(entry.path());
      }
    }
    std::stable_sort(directories.begin(), directories.end(),
                     [](const auto &lhs, const auto &rhs) {
                       return Depth(lhs) > Depth(rhs);
                     });

    std::size_t pass = 0;
    for (const auto &directory : directories) {
      std::error_code ec;
      if (std::filesystem::is_empty(directory, ec) && !ec &&
          Remove(directory, "cleanup.directory_removed")) {
        ++pass;
      }
    }
    removed += pass;
    if (pass == 0) {
      return removed;
    }
  }
}

CleanupSummary CleanupJob::Run() {
  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    throw ConfigurationError("Destination directory '" + root_.string() +
                             "' does not exist.");
  }

  logger_->Log(LogLevel::kDebug, "cleanup.start", {{"root", root_.string()}});
  CleanupSummary summary;
  RemoveArchivesAndBrokenLinks(summary);
  summary.directories_removed = RemoveEmptyDirectories();

  logger_->Log(
      LogLevel::kInfo, "cleanup.complete",
      {{"archives_removed", std::to_string(summary.archives_removed)},
       {"broken_links_removed", std::to_string(summary.broken_links_removed)},
       {"directories_removed", std::to_string(summary.directories_removed)}});
  return summary;
}

} // namespace showlink
