#include <showlink/cli.h>

#include <showlink/exit_codes.h>
#include <showlink/models.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace showlink {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Expected a boolean value, got: " + value);
}

void AppendMarker(const std::string &raw_marker,
                  std::vector<std::string> &target) {
  auto marker = ToLower(Trim(raw_marker));
  if (marker.empty()) {
    return;
  }
  if (std::find(target.begin(), target.end(), marker) == target.end()) {
    target.push_back(std::move(marker));
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, RunOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        ParseLogLevel(RequireValue(arguments, index, std::string(argument)));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleSwitch(const std::string &argument, RunOptions &options) {
  if (argument == "--no-cleanup") {
    options.cleanup = false;
    return true;
  }
  if (argument == "--prune-broken-links") {
    options.prune_broken_links = true;
    return true;
  }
  if (argument == "--no-part-variants") {
    options.part_spacing_variants = false;
    return true;
  }
  return false;
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, RunOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--source") {
    options.source = RequireValue(arguments, index, "--source");
    return true;
  }
  if (argument == "--destination") {
    options.destination = RequireValue(arguments, index, "--destination");
    return true;
  }
  if (argument == "--log-dir") {
    options.log_directory = RequireValue(arguments, index, "--log-dir");
    return true;
  }
  if (argument == "--workers") {
    options.workers =
        ParseWorkerCount(RequireValue(arguments, index, "--workers"));
    return true;
  }
  return HandleSwitch(argument, options) ||
         HandleLoggingOption(arguments, index, options);
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"source",
                                                "destination",
                                                "log_dir",
                                                "workers",
                                                "cleanup",
                                                "prune_broken_links",
                                                "part_spacing_variants",
                                                "part_markers",
                                                "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"source_dir", "source"},
      {"destination_dir", "destination"},
      {"dest", "destination"},
      {"logs", "log_dir"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

std::string ExtractPathLike(const YAML::Node &node,
                            const std::string &key_name) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsMap()) {
    for (const auto &candidate : {"path", "dir", "directory"}) {
      if (node[candidate]) {
        return ExtractStringScalar(node[candidate], key_name);
      }
    }
    throw std::invalid_argument("Config key '" + key_name +
                                "' map must contain 'path', 'dir', or "
                                "'directory'");
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or mapping");
}

std::vector<std::string> ExtractMarkers(const YAML::Node &node,
                                        const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      AppendMarker(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    AppendMarker(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "part_markers") {
    return ExtractMarkers(node, key);
  }
  if (key == "cleanup" || key == "prune_broken_links" ||
      key == "part_spacing_variants") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "source" || key == "destination" || key == "log_dir") {
    return ConfigValue{ExtractPathLike(node, key)};
  }
  if (key == "workers" || key == "log_level") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, RunOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "source") {
      options.source = std::get<std::string>(value);
      continue;
    }
    if (key == "destination") {
      options.destination = std::get<std::string>(value);
      continue;
    }
    if (key == "log_dir") {
      options.log_directory = std::get<std::string>(value);
      continue;
    }
    if (key == "workers") {
      options.workers = ParseWorkerCount(std::get<std::string>(value));
      continue;
    }
    if (key == "cleanup") {
      options.cleanup = std::get<bool>(value);
      continue;
    }
    if (key == "prune_broken_links") {
      options.prune_broken_links = std::get<bool>(value);
      continue;
    }
    if (key == "part_spacing_variants") {
      options.part_spacing_variants = std::get<bool>(value);
      continue;
    }
    if (key == "part_markers") {
      options.part_markers = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    ThrowUnknownKey(key);
  }
}

void ValidateOptions(const RunOptions &options) {
  if (!options.source) {
    throw ConfigurationError("--source is required (or set in config file)");
  }
  if (!options.destination) {
    throw ConfigurationError(
        "--destination is required (or set in config file)");
  }
}

} // namespace

void PrintUsage(std::ostream &stream) {
  stream
      << "Usage: showlink [options] [path]\n"
      << "Links TV-series episodes from a download tree into a media library.\n"
      << "Without a path every entry under the source directory is processed;\n"
      << "a directory path is processed as one show folder, a file path as\n"
      << "one episode inside its folder.\n\n"
      << "Options:\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --source <dir>        Download tree holding release folders\n"
      << "  --destination <dir>   Library root receiving the symlinks\n"
      << "  --log-dir <dir>       Directory for the index logs (default: "
         "logs)\n"
      << "  --workers <n>         Entries processed in parallel (default: 1)\n"
      << "  --no-cleanup          Skip the post-run destination cleanup\n"
      << "  --prune-broken-links  Remove symlinks whose target is gone\n"
      << "  --no-part-variants    Match 'Part N' folder names literally\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n";
}

std::size_t ParseWorkerCount(const std::string &value) {
  const auto trimmed = Trim(value);
  std::size_t count = 0;
  const auto *first = trimmed.data();
  const auto *last = trimmed.data() + trimmed.size();
  const auto [end, error] = std::from_chars(first, last, count);
  if (trimmed.empty() || error != std::errc() || end != last || count == 0) {
    throw std::invalid_argument("Worker count must be a positive integer: " +
                                value);
  }
  return count;
}

RunOptions ParseArguments(const std::vector<std::string> &arguments) {
  RunOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (!argument.empty() && argument.front() != '-') {
      if (options.target) {
        throw std::invalid_argument("Only one path may be given, got '" +
                                    options.target->string() + "' and '" +
                                    argument + "'");
      }
      options.target = argument;
      continue;
    }
    if (!DispatchOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + argument);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

RunOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigurationError("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  RunOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

RunOptions MergeOptions(const RunOptions &config_options,
                        const RunOptions &cli_options) {
  RunOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.source, cli_options.source);
  override_value(merged.destination, cli_options.destination);
  override_value(merged.log_directory, cli_options.log_directory);
  override_value(merged.workers, cli_options.workers);
  override_value(merged.cleanup, cli_options.cleanup);
  override_value(merged.prune_broken_links, cli_options.prune_broken_links);
  override_value(merged.part_spacing_variants,
                 cli_options.part_spacing_variants);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.target, cli_options.target);

  if (!cli_options.part_markers.empty()) {
    merged.part_markers = cli_options.part_markers;
  }
  merged.show_help = cli_options.show_help;
  return merged;
}

RunOptions ResolveOptions(const RunOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  RunOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateOptions(merged);
  return merged;
}

LoggingConfig BuildLoggingConfig(const RunOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kInfo);
  return logging;
}

EngineConfig BuildEngineConfig(const RunOptions &options) {
  ValidateOptions(options);
  EngineConfig config;
  config.source = *options.source;
  config.destination = *options.destination;
  config.log_directory =
      options.log_directory.value_or(std::filesystem::path(kDefaultLogDirectory));
  config.workers = options.workers.value_or(1);
  config.cleanup = options.cleanup.value_or(true);
  config.cleanup_options.prune_broken_links =
      options.prune_broken_links.value_or(false);
  config.fuzzy.part_spacing_variants =
      options.part_spacing_variants.value_or(true);
  if (!options.part_markers.empty()) {
    config.fuzzy.part_markers = options.part_markers;
  }
  config.target = options.target;
  return config;
}

int RunReconcile(const std::vector<std::string> &arguments,
                 std::ostream &log_stream) {
  const auto cli_options = ParseArguments(arguments);
  if (cli_options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  const auto merged = ResolveOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), log_stream);
  ReconcileEngine engine(logger);
  engine.Run(BuildEngineConfig(merged));
  return kExitSuccess;
}

} // namespace showlink
