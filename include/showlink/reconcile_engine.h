#pragma once

#include <showlink/destination_resolver.h>
#include <showlink/interfaces.h>
#include <showlink/logging.h>
#include <showlink/models.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace showlink {

struct EngineConfig {
  std::filesystem::path source;
  std::filesystem::path destination;
  std::filesystem::path log_directory;
  std::size_t workers = 1;
  bool cleanup = true;
  CleanupOptions cleanup_options;
  FuzzyMatchOptions fuzzy;
  std::optional<std::filesystem::path> target;
};

RunSummary Summarize(std::vector<EntryReport> reports);

class ReconcileEngine {
public:
  explicit ReconcileEngine(std::shared_ptr<Logger> logger = nullptr);

  RunSummary Run(const EngineConfig &config);
  RunSummary Run(const EngineConfig &config, IndexStore &store);

private:
  std::vector<SourceEntry> Validate(const EngineConfig &config) const;

  std::shared_ptr<Logger> logger_;
};

} // namespace showlink
