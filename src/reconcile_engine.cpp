#include <showlink/reconcile_engine.h>

#include <showlink/cleanup_job.h>
#include <showlink/index_store.h>
#include <showlink/name_classifier.h>
#include <showlink/source_scanner.h>
#include <showlink/symlink_reconciler.h>

#include <chrono>
#include <string>
#include <system_error>
#include <utility>

namespace showlink {
namespace {

void RequireDirectory(const std::filesystem::path &path, const char *label) {
  if (path.empty()) {
    throw ConfigurationError(std::string(label) + " directory is not set.");
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    throw ConfigurationError(std::string(label) + " directory '" +
                             path.string() + "' does not exist.");
  }
}

void Tally(const LinkOutcome &link, RunSummary &summary) {
  switch (link.state) {
  case EntryState::kLinked:
    ++summary.links_created;
    return;
  case EntryState::kErrored:
    ++summary.errors;
    return;
  case EntryState::kSkipped:
    break;
  default:
    return;
  }
  switch (link.skip) {
  case SkipReason::kAlreadyLinked:
    ++summary.links_existing;
    break;
  case SkipReason::kArchive:
    ++summary.archives_skipped;
    break;
  case SkipReason::kNoSeasonMarker:
    ++summary.files_without_season;
    break;
  case SkipReason::kNone:
    break;
  }
}

void ValidateDirectories(const EngineConfig &config) {
  RequireDirectory(config.source, "Source");
  RequireDirectory(config.destination, "Destination");
  if (config.log_directory.empty()) {
    throw ConfigurationError("Log directory is not set.");
  }
}

} // namespace

RunSummary Summarize(std::vector<EntryReport> reports) {
  RunSummary summary;
  summary.entries = reports.size();
  for (const auto &report : reports) {
    if (report.state == EntryState::kPending) {
      ++summary.not_processed;
      continue;
    }
    for (const auto &link : report.links) {
      Tally(link, summary);
    }
    if (report.state == EntryState::kErrored && report.links.empty()) {
      ++summary.errors;
    }
  }
  summary.reports = std::move(reports);
  return summary;
}

ReconcileEngine::ReconcileEngine(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<SourceEntry>
ReconcileEngine::Validate(const EngineConfig &config) const {
  ValidateDirectories(config);

  SourceScanner scanner(logger_);
  if (config.target) {
    return {scanner.EntryForTarget(*config.target)};
  }
  return scanner.ScanRoot(config.source);
}

RunSummary ReconcileEngine::Run(const EngineConfig &config) {
  ValidateDirectories(config);
  LogBackedIndexStore store(config.log_directory, logger_);
  return Run(config, store);
}

RunSummary ReconcileEngine::Run(const EngineConfig &config,
                                IndexStore &store) {
  const auto entries = Validate(config);
  const auto destination =
      std::filesystem::weakly_canonical(config.destination);
  logger_->Log(LogLevel::kInfo, "run.start",
               {{"source", config.source.string()},
                {"destination", destination.string()},
                {"entries", std::to_string(entries.size())},
                {"workers", std::to_string(config.workers)}});
  const auto started = std::chrono::steady_clock::now();

  const auto targets = store.RebuildLinkIndex(destination);
  const auto folders = store.RebuildFolderIndex(destination);
  logger_->Log(LogLevel::kDebug, "run.stage.complete",
               {{"stage", "index"},
                {"folders", std::to_string(folders.size())},
                {"link_targets", std::to_string(targets.size())}});

  const NameClassifier classifier;
  DestinationResolver resolver(destination, store, config.fuzzy, logger_);
  SymlinkReconciler reconciler(destination, store, classifier, resolver,
                               ReconcilerOptions{config.workers}, logger_);
  auto summary = Summarize(reconciler.Run(entries));
  logger_->Log(LogLevel::kDebug, "run.stage.complete",
               {{"stage", "reconcile"},
                {"links_created", std::to_string(summary.links_created)}});

  if (config.cleanup) {
    CleanupJob cleanup(destination, config.cleanup_options, logger_);
    summary.cleanup = cleanup.Run();
    summary.cleanup_ran = true;
  }

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count();
  logger_->Log(
      LogLevel::kInfo, "run.complete",
      {{"duration_ms", std::to_string(duration_ms)},
       {"entries", std::to_string(summary.entries)},
       {"links_created", std::to_string(summary.links_created)},
       {"links_existing", std::to_string(summary.links_existing)},
       {"archives_skipped", std::to_string(summary.archives_skipped)},
       {"files_without_season", std::to_string(summary.files_without_season)},
       {"errors", std::to_string(summary.errors)},
       {"not_processed", std::to_string(summary.not_processed)}});
  return summary;
}

} // namespace showlink
