#pragma once

#include <showlink/logging.h>
#include <showlink/models.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace showlink {

class CleanupJob {
public:
  CleanupJob(std::filesystem::path destination_root, CleanupOptions options = {},
             std::shared_ptr<Logger> logger = nullptr);

  CleanupSummary Run();

private:
  void RemoveArchivesAndBrokenLinks(CleanupSummary &summary);
  std::size_t RemoveEmptyDirectories();
  bool Remove(const std::filesystem::path &path, const char *event);
  bool TargetMissing(const std::filesystem::path &link);

  std::filesystem::path root_;
  CleanupOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace showlink
