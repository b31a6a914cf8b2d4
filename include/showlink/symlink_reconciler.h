#pragma once

#include <showlink/destination_resolver.h>
#include <showlink/interfaces.h>
#include <showlink/logging.h>
#include <showlink/models.h>
#include <showlink/name_classifier.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

namespace showlink {

struct ReconcilerOptions {
  std::size_t workers = 1;
};

class SymlinkReconciler {
public:
  SymlinkReconciler(std::filesystem::path destination_root, IndexStore &store,
                    const NameClassifier &classifier,
                    DestinationResolver &resolver,
                    ReconcilerOptions options = {},
                    std::shared_ptr<Logger> logger = nullptr);

  EntryReport ProcessEntry(const SourceEntry &entry);

  std::vector<EntryReport> Run(const std::vector<SourceEntry> &entries);

  // Stops handing out new entries; entries already started run to the end.
  void RequestStop() { stop_requested_ = true; }
  bool StopRequested() const { return stop_requested_; }

private:
  void ProcessFolder(EntryReport &report);
  void ProcessTargetFile(EntryReport &report);
  void ProcessLooseFile(EntryReport &report);

  bool SkipArchive(const std::filesystem::path &source, LinkOutcome &outcome);
  LinkOutcome LinkFile(const std::filesystem::path &source,
                       const std::filesystem::path &destination);
  void Finish(EntryReport &report) const;

  std::filesystem::path root_;
  IndexStore *store_;
  const NameClassifier *classifier_;
  DestinationResolver *resolver_;
  ReconcilerOptions options_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> stop_requested_{false};
};

} // namespace showlink
