#pragma once

#include <showlink/interfaces.h>
#include <showlink/logging.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace showlink {

inline constexpr char kFolderLogName[] = "folder_names.log";
inline constexpr char kLinkLogName[] = "symlinks.log";
inline constexpr char kSkippedArchiveLogName[] = "skipped_rar_files.log";

class LogBackedIndexStore : public IndexStore {
public:
  LogBackedIndexStore(std::filesystem::path log_directory,
                      std::shared_ptr<Logger> logger);

  std::set<std::filesystem::path>
  RebuildFolderIndex(const std::filesystem::path &destination_root) override;
  std::set<std::filesystem::path>
  RebuildLinkIndex(const std::filesystem::path &destination_root) override;

  bool IsKnownFolder(const std::filesystem::path &folder) const override;
  std::vector<std::filesystem::path> KnownFolders() const override;
  bool RecordNewFolder(const std::filesystem::path &folder) override;

  bool IsLinkTarget(const std::filesystem::path &target) const override;
  bool ClaimLinkTarget(const std::filesystem::path &target) override;
  void CommitLinkTarget(const std::filesystem::path &target) override;
  void ReleaseLinkTarget(const std::filesystem::path &target) override;

  bool IsArchiveSkipped(const std::filesystem::path &archive) const override;
  bool RecordSkippedArchive(const std::filesystem::path &archive) override;

  const std::filesystem::path &LogDirectory() const { return log_directory_; }
  std::filesystem::path FolderLogPath() const;
  std::filesystem::path LinkLogPath() const;
  std::filesystem::path SkippedArchiveLogPath() const;

private:
  void LoadSkippedArchives();
  void RewriteLog(const std::filesystem::path &log_path,
                  const std::vector<std::filesystem::path> &entries) const;
  void AppendLog(const std::filesystem::path &log_path,
                 const std::filesystem::path &entry) const;

  std::filesystem::path log_directory_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::vector<std::filesystem::path> folder_order_;
  std::unordered_set<std::string> folders_;
  std::unordered_set<std::string> link_targets_;
  std::unordered_set<std::string> skipped_archives_;
};

std::string IndexKey(const std::filesystem::path &path);

} // namespace showlink
