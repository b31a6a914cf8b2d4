#pragma once

#include <showlink/logging.h>
#include <showlink/models.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace showlink {

class SourceScanner {
public:
  explicit SourceScanner(std::shared_ptr<Logger> logger = nullptr);

  std::vector<SourceEntry> ScanRoot(const std::filesystem::path &source_root) const;

  SourceEntry EntryForTarget(const std::filesystem::path &target) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace showlink
