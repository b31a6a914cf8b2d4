#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace showlink {

class ConfigurationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class EntryKind { kFolder, kFile, kLooseFile };

struct SourceEntry {
  std::filesystem::path path;
  EntryKind kind = EntryKind::kFolder;
  // Only set for kFile: the episode file inside `path`.
  std::string target_file;
};

struct ClassifiedSeries {
  std::string name;
  std::optional<std::string> year;
  std::optional<int> season;
};

struct EpisodeRef {
  int season = 0;
  int episode = 0;
};

enum class EntryState {
  kPending,
  kClassifying,
  kResolving,
  kLinkChecking,
  kSkipped,
  kLinked,
  kErrored
};

std::string EntryStateName(EntryState state);

enum class SkipReason { kNone, kAlreadyLinked, kArchive, kNoSeasonMarker };

struct LinkOutcome {
  std::filesystem::path source;
  std::filesystem::path destination;
  EntryState state = EntryState::kPending;
  SkipReason skip = SkipReason::kNone;
  std::string reason;
};

struct EntryReport {
  SourceEntry entry;
  EntryState state = EntryState::kPending;
  std::string reason;
  std::filesystem::path series_folder;
  std::vector<LinkOutcome> links;
};

struct CleanupOptions {
  bool prune_broken_links = false;
};

struct CleanupSummary {
  std::size_t archives_removed = 0;
  std::size_t broken_links_removed = 0;
  std::size_t directories_removed = 0;
};

struct RunSummary {
  std::size_t entries = 0;
  std::size_t links_created = 0;
  std::size_t links_existing = 0;
  std::size_t archives_skipped = 0;
  std::size_t files_without_season = 0;
  std::size_t errors = 0;
  std::size_t not_processed = 0;
  bool cleanup_ran = false;
  CleanupSummary cleanup;
  std::vector<EntryReport> reports;
};

} // namespace showlink
