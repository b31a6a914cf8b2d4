#pragma once

#include <showlink/interfaces.h>
#include <showlink/logging.h>
#include <showlink/models.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace showlink {

struct FuzzyMatchOptions {
  bool part_spacing_variants = true;
  std::vector<std::string> part_markers = {"p", "part"};
};

enum class ResolutionStrategy { kExact, kFuzzy, kAllocated };

std::string ResolutionStrategyName(ResolutionStrategy strategy);

struct Resolution {
  std::filesystem::path folder;
  ResolutionStrategy strategy = ResolutionStrategy::kExact;
};

std::filesystem::path CandidateFolder(const std::filesystem::path &root,
                                      const std::string &series_name);

std::string BuildAliasPattern(const std::string &series_name,
                              const FuzzyMatchOptions &options);

class DestinationResolver {
public:
  DestinationResolver(std::filesystem::path destination_root,
                      IndexStore &store, FuzzyMatchOptions options = {},
                      std::shared_ptr<Logger> logger = nullptr);

  Resolution Resolve(const ClassifiedSeries &series);

  const std::filesystem::path &DestinationRoot() const { return root_; }

private:
  std::optional<std::filesystem::path>
  MatchExact(const ClassifiedSeries &series) const;
  std::optional<std::filesystem::path>
  MatchFuzzy(const ClassifiedSeries &series) const;
  std::filesystem::path Allocate(const ClassifiedSeries &series);

  std::filesystem::path root_;
  IndexStore *store_;
  FuzzyMatchOptions options_;
  std::shared_ptr<Logger> logger_;
  std::mutex mutex_;
};

} // namespace showlink
