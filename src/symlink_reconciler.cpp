#include <showlink/symlink_reconciler.h>

#include <showlink/archive_rules.h>
#include <showlink/episode_extractor.h>

#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>

namespace showlink {
namespace {

std::string EntryKindName(EntryKind kind) {
  switch (kind) {
  case EntryKind::kFolder:
    return "folder";
  case EntryKind::kFile:
    return "file";
  case EntryKind::kLooseFile:
    return "loose-file";
  }
  return "unknown";
}

struct PlannedLink {
  std::filesystem::path source;
  int season = 0;
};

} // namespace

SymlinkReconciler::SymlinkReconciler(std::filesystem::path destination_root,
                                     IndexStore &store,
                                     const NameClassifier &classifier,
                                     DestinationResolver &resolver,
                                     ReconcilerOptions options,
                                     std::shared_ptr<Logger> logger)
    : root_(std::move(destination_root)), store_(&store),
      classifier_(&classifier), resolver_(&resolver), options_(options),
      logger_(EnsureLogger(std::move(logger))) {}

bool SymlinkReconciler::SkipArchive(const std::filesystem::path &source,
                                    LinkOutcome &outcome) {
  if (!IsMultipartArchive(source)) {
    return false;
  }
  outcome.source = source;
  outcome.state = EntryState::kSkipped;
  outcome.skip = SkipReason::kArchive;
  outcome.reason = "multi-part archive";
  if (store_->RecordSkippedArchive(source)) {
    logger_->Log(LogLevel::kInfo, "archive.skipped",
                 {{"path", source.string()}});
  } else {
    logger_->Log(LogLevel::kDebug, "archive.skipped.known",
                 {{"path", source.string()}});
  }
  return true;
}

LinkOutcome
SymlinkReconciler::LinkFile(const std::filesystem::path &source,
                            const std::filesystem::path &destination) {
  LinkOutcome outcome{source, destination, EntryState::kLinkChecking,
                      SkipReason::kNone, {}};

  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(source, ec);
  if (ec) {
    resolved = source.lexically_normal();
  }

  if (!store_->ClaimLinkTarget(resolved)) {
    outcome.state = EntryState::kSkipped;
    outcome.skip = SkipReason::kAlreadyLinked;
    outcome.reason = "symlink already exists with the same target";
    logger_->Log(LogLevel::kInfo, "link.exists",
                 {{"source", source.string()}});
    return outcome;
  }

  try {
    std::filesystem::create_directories(destination.parent_path());
    const auto status = std::filesystem::symlink_status(destination);
    if (std::filesystem::exists(status)) {
      if (std::filesystem::is_symlink(status) &&
          std::filesystem::weakly_canonical(destination) == resolved) {
        store_->CommitLinkTarget(resolved);
        outcome.state = EntryState::kSkipped;
        outcome.skip = SkipReason::kAlreadyLinked;
        outcome.reason = "symlink already exists with the same target";
        logger_->Log(LogLevel::kInfo, "link.exists",
                     {{"source", source.string()},
                      {"destination", destination.string()}});
        return outcome;
      }
      store_->ReleaseLinkTarget(resolved);
      outcome.state = EntryState::kErrored;
      outcome.reason = "destination already exists";
      logger_->Log(LogLevel::kError, "link.failed",
                   {{"source", source.string()},
                    {"destination", destination.string()},
                    {"error", outcome.reason}});
      return outcome;
    }

    std::filesystem::create_symlink(source, destination);
    store_->CommitLinkTarget(resolved);
    outcome.state = EntryState::kLinked;
    logger_->Log(LogLevel::kInfo, "link.created",
                 {{"source", source.string()},
                  {"destination", destination.string()}});
  } catch (const std::filesystem::filesystem_error &error) {
    store_->ReleaseLinkTarget(resolved);
    outcome.state = EntryState::kErrored;
    outcome.reason = error.code().message();
    logger_->Log(LogLevel::kError, "link.failed",
                 {{"source", source.string()},
                  {"destination", destination.string()},
                  {"error", error.what()}});
  }
  return outcome;
}

void SymlinkReconciler::ProcessFolder(EntryReport &report) {
  const auto &folder = report.entry.path;
  report.state = EntryState::kClassifying;
  const auto series = classifier_->Classify(folder.filename().string());
  if (!series) {
    report.state = EntryState::kErrored;
    report.reason = "unable to determine series name";
    return;
  }

  std::vector<std::filesystem::path> files;
  for (const auto &child : std::filesystem::directory_iterator(folder)) {
    std::error_code ec;
    if (child.is_regular_file(ec)) {
      files.push_back(child.path());
    }
  }
  std::sort(files.begin(), files.end());

  std::vector<PlannedLink> planned;
  for (const auto &file : files) {
    LinkOutcome outcome{file, {}, EntryState::kClassifying, SkipReason::kNone,
                        {}};
    if (SkipArchive(file, outcome)) {
      report.links.push_back(std::move(outcome));
      continue;
    }
    const auto season = ExtractSeason(file.filename().string());
    if (!season) {
      outcome.state = EntryState::kSkipped;
      outcome.skip = SkipReason::kNoSeasonMarker;
      outcome.reason = "no season marker in file name";
      logger_->Log(LogLevel::kDebug, "file.skipped",
                   {{"path", file.string()}, {"reason", outcome.reason}});
      report.links.push_back(std::move(outcome));
      continue;
    }
    planned.push_back({file, *season});
  }
  if (planned.empty()) {
    return;
  }

  report.state = EntryState::kResolving;
  const auto resolution = resolver_->Resolve(*series);
  report.series_folder = resolution.folder;

  report.state = EntryState::kLinkChecking;
  for (const auto &link : planned) {
    report.links.push_back(LinkFile(link.source,
                                    resolution.folder /
                                        SeasonFolderName(link.season) /
                                        link.source.filename()));
  }
}

void SymlinkReconciler::ProcessTargetFile(EntryReport &report) {
  const auto &folder = report.entry.path;
  const auto &target_file = report.entry.target_file;
  const auto source = folder / target_file;

  report.state = EntryState::kClassifying;
  LinkOutcome archive{source, {}, EntryState::kClassifying, SkipReason::kNone,
                      {}};
  if (SkipArchive(source, archive)) {
    report.links.push_back(std::move(archive));
    return;
  }

  const auto series = classifier_->Classify(folder.filename().string());
  if (!series) {
    report.state = EntryState::kErrored;
    report.reason = "unable to determine series name";
    return;
  }
  const auto episode = ExtractEpisode(target_file);
  if (!episode) {
    report.state = EntryState::kErrored;
    report.reason = "unable to extract season and episode information";
    return;
  }

  report.state = EntryState::kResolving;
  const auto resolution = resolver_->Resolve(*series);
  report.series_folder = resolution.folder;

  report.state = EntryState::kLinkChecking;
  report.links.push_back(LinkFile(
      source,
      resolution.folder / SeasonFolderName(episode->season) / target_file));
}

void SymlinkReconciler::ProcessLooseFile(EntryReport &report) {
  const auto &source = report.entry.path;
  report.state = EntryState::kClassifying;
  LinkOutcome archive{source, {}, EntryState::kClassifying, SkipReason::kNone,
                      {}};
  if (SkipArchive(source, archive)) {
    report.links.push_back(std::move(archive));
    return;
  }
  report.state = EntryState::kLinkChecking;
  report.links.push_back(LinkFile(source, root_ / source.filename()));
}

void SymlinkReconciler::Finish(EntryReport &report) const {
  if (report.state == EntryState::kErrored) {
    return;
  }
  const auto has_state = [&](EntryState state) {
    return std::any_of(report.links.begin(), report.links.end(),
                       [&](const LinkOutcome &link) {
                         return link.state == state;
                       });
  };
  if (has_state(EntryState::kLinked)) {
    report.state = EntryState::kLinked;
    return;
  }
  if (has_state(EntryState::kErrored)) {
    report.state = EntryState::kErrored;
    report.reason = "no file could be linked";
    return;
  }
  report.state = EntryState::kSkipped;
  if (report.links.empty()) {
    report.reason = "no episode files found";
  } else if (report.links.size() == 1) {
    report.reason = report.links.front().reason;
  } else {
    report.reason = "nothing new to link";
  }
}

EntryReport SymlinkReconciler::ProcessEntry(const SourceEntry &entry) {
  EntryReport report;
  report.entry = entry;
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(entry.path, ec);
  if (!ec) {
    report.entry.path = absolute;
  }
  logger_->Log(LogLevel::kDebug, "entry.start",
               {{"path", report.entry.path.string()},
                {"kind", EntryKindName(entry.kind)}});

  try {
    switch (entry.kind) {
    case EntryKind::kFolder:
      ProcessFolder(report);
      break;
    case EntryKind::kFile:
      ProcessTargetFile(report);
      break;
    case EntryKind::kLooseFile:
      ProcessLooseFile(report);
      break;
    }
    Finish(report);
  } catch (const std::filesystem::filesystem_error &error) {
    report.state = EntryState::kErrored;
    report.reason = error.what();
  } catch (const std::exception &error) {
    report.state = EntryState::kErrored;
    report.reason = error.what();
  }

  if (report.state == EntryState::kErrored) {
    logger_->Log(LogLevel::kError, "entry.errored",
                 {{"path", report.entry.path.string()},
                  {"reason", report.reason}});
  } else {
    LogFields fields = {{"path", report.entry.path.string()},
                        {"state", EntryStateName(report.state)}};
    if (!report.series_folder.empty()) {
      fields.emplace_back("folder", report.series_folder.string());
    }
    if (!report.reason.empty()) {
      fields.emplace_back("reason", report.reason);
    }
    logger_->Log(LogLevel::kInfo,
                 report.state == EntryState::kLinked ? "entry.linked"
                                                     : "entry.skipped",
                 std::move(fields));
  }
  return report;
}

std::vector<EntryReport>
SymlinkReconciler::Run(const std::vector<SourceEntry> &entries) {
  std::vector<EntryReport> reports(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    reports[i].entry = entries[i];
  }

  std::atomic<std::size_t> next{0};
  const auto worker = [&] {
    while (!stop_requested_) {
      const auto index = next++;
      if (index >= entries.size()) {
        return;
      }
      reports[index] = ProcessEntry(entries[index]);
    }
  };

  const auto worker_count =
      std::min(std::max<std::size_t>(options_.workers, 1), entries.size());
  if (worker_count <= 1) {
    worker();
    return reports;
  }

  std::vector<std::thread> threads;
  try {
    for (std::size_t i = 0; i < worker_count; ++i) {
      threads.emplace_back(worker);
    }
  } catch (const std::system_error &error) {
    logger_->Log(LogLevel::kWarn, "reconcile.worker_spawn_failed",
                 {{"started", std::to_string(threads.size())},
                  {"error", error.what()}});
  }
  if (threads.empty()) {
    worker();
  }
  for (auto &thread : threads) {
    thread.join();
  }
  return reports;
}

} // namespace showlink
