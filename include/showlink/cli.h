#pragma once

#include <showlink/logging.h>
#include <showlink/reconcile_engine.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace showlink {

struct RunOptions {
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> source;
  std::optional<std::filesystem::path> destination;
  std::optional<std::filesystem::path> log_directory;
  std::optional<std::size_t> workers;
  std::optional<bool> cleanup;
  std::optional<bool> prune_broken_links;
  std::optional<bool> part_spacing_variants;
  std::vector<std::string> part_markers;
  std::optional<LogLevel> log_level;
  std::optional<std::filesystem::path> target;
  bool show_help = false;
};

inline constexpr char kDefaultLogDirectory[] = "logs";

void PrintUsage(std::ostream &stream);

RunOptions ParseArguments(const std::vector<std::string> &arguments);
RunOptions ParseConfigFile(const std::filesystem::path &path);
RunOptions MergeOptions(const RunOptions &config_options,
                        const RunOptions &cli_options);
RunOptions ResolveOptions(const RunOptions &cli_options);

std::size_t ParseWorkerCount(const std::string &value);
LoggingConfig BuildLoggingConfig(const RunOptions &options);
EngineConfig BuildEngineConfig(const RunOptions &options);

int RunReconcile(const std::vector<std::string> &arguments,
                 std::ostream &log_stream);

} // namespace showlink
