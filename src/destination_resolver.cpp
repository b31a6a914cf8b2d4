#include <showlink/destination_resolver.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <utility>

namespace showlink {
namespace {

bool IsDigits(const std::string &value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char ch) {
           return std::isdigit(ch) != 0;
         });
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string EscapeRegex(const std::string &value) {
  static const std::string kSpecial = "\\^$.|?*+()[]{}";
  std::string escaped;
  escaped.reserve(value.size() * 2);
  for (const auto character : value) {
    if (kSpecial.find(character) != std::string::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::vector<std::string> AliasTokens(const std::string &series_name) {
  std::istringstream stream(series_name);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    token.erase(std::remove_if(token.begin(), token.end(),
                               [](char ch) { return ch == '(' || ch == ')'; }),
                token.end());
    if (token.empty() || (token.size() == 4 && IsDigits(token))) {
      continue;
    }
    tokens.push_back(std::move(token));
  }
  return tokens;
}

// Markers sorted longest first so "part2" is not read as "p" + "art2".
std::vector<std::string> SortedMarkers(const FuzzyMatchOptions &options) {
  std::vector<std::string> markers;
  for (const auto &marker : options.part_markers) {
    if (!marker.empty()) {
      markers.push_back(ToLower(marker));
    }
  }
  std::sort(markers.begin(), markers.end(),
            [](const std::string &lhs, const std::string &rhs) {
              return lhs.size() > rhs.size();
            });
  markers.erase(std::unique(markers.begin(), markers.end()), markers.end());
  return markers;
}

std::string PartFragment(const std::vector<std::string> &markers,
                         const std::string &number) {
  std::string alternatives;
  for (const auto &marker : markers) {
    if (!alternatives.empty()) {
      alternatives.push_back('|');
    }
    alternatives.append(EscapeRegex(marker));
  }
  return "(?:" + alternatives + ")[\\s._-]*" + number;
}

std::optional<std::string> GluedPartNumber(
    const std::string &token, const std::vector<std::string> &markers) {
  const auto lowered = ToLower(token);
  for (const auto &marker : markers) {
    if (lowered.size() > marker.size() && lowered.rfind(marker, 0) == 0) {
      const auto rest = lowered.substr(marker.size());
      if (IsDigits(rest)) {
        return rest;
      }
    }
  }
  return std::nullopt;
}

} // namespace

std::string ResolutionStrategyName(ResolutionStrategy strategy) {
  switch (strategy) {
  case ResolutionStrategy::kExact:
    return "exact";
  case ResolutionStrategy::kFuzzy:
    return "fuzzy";
  case ResolutionStrategy::kAllocated:
    return "allocated";
  }
  return "unknown";
}

std::filesystem::path CandidateFolder(const std::filesystem::path &root,
                                      const std::string &series_name) {
  static const std::regex kNumberedSuffix(" -[0-9]+$");
  return root / std::regex_replace(series_name, kNumberedSuffix, "");
}

std::string BuildAliasPattern(const std::string &series_name,
                              const FuzzyMatchOptions &options) {
  const auto tokens = AliasTokens(series_name);
  const auto markers = SortedMarkers(options);
  const bool variants = options.part_spacing_variants && !markers.empty();

  std::string pattern;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    std::string fragment;
    const auto lowered = ToLower(tokens[i]);
    if (variants &&
        std::find(markers.begin(), markers.end(), lowered) != markers.end() &&
        i + 1 < tokens.size() && IsDigits(tokens[i + 1])) {
      fragment = PartFragment(markers, tokens[i + 1]);
      ++i;
    } else if (const auto number =
                   variants ? GluedPartNumber(tokens[i], markers)
                            : std::optional<std::string>{}) {
      fragment = PartFragment(markers, *number);
    } else {
      fragment = EscapeRegex(tokens[i]);
    }
    if (!pattern.empty()) {
      pattern.append(".*");
    }
    pattern.append(fragment);
  }
  return pattern;
}

DestinationResolver::DestinationResolver(std::filesystem::path destination_root,
                                         IndexStore &store,
                                         FuzzyMatchOptions options,
                                         std::shared_ptr<Logger> logger)
    : root_(std::move(destination_root)), store_(&store),
      options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {}

std::optional<std::filesystem::path>
DestinationResolver::MatchExact(const ClassifiedSeries &series) const {
  const auto candidate = CandidateFolder(root_, series.name);
  if (store_->IsKnownFolder(candidate)) {
    return candidate;
  }
  return std::nullopt;
}

std::optional<std::filesystem::path>
DestinationResolver::MatchFuzzy(const ClassifiedSeries &series) const {
  const auto pattern = BuildAliasPattern(series.name, options_);
  if (pattern.empty()) {
    return std::nullopt;
  }
  const std::regex alias(pattern, std::regex::ECMAScript | std::regex::icase);
  for (const auto &folder : store_->KnownFolders()) {
    if (std::regex_search(folder.filename().string(), alias)) {
      return folder;
    }
  }
  return std::nullopt;
}

std::filesystem::path
DestinationResolver::Allocate(const ClassifiedSeries &series) {
  const auto candidate = CandidateFolder(root_, series.name);
  std::filesystem::create_directories(candidate);
  if (store_->RecordNewFolder(candidate)) {
    logger_->Log(LogLevel::kInfo, "folder.allocated",
                 {{"series", series.name}, {"folder", candidate.string()}});
  }
  return candidate;
}

Resolution DestinationResolver::Resolve(const ClassifiedSeries &series) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (auto exact = MatchExact(series)) {
    logger_->Log(LogLevel::kDebug, "folder.matched",
                 {{"series", series.name},
                  {"folder", exact->string()},
                  {"strategy", "exact"}});
    return Resolution{*exact, ResolutionStrategy::kExact};
  }
  if (auto fuzzy = MatchFuzzy(series)) {
    logger_->Log(LogLevel::kInfo, "folder.matched",
                 {{"series", series.name},
                  {"folder", fuzzy->string()},
                  {"strategy", "fuzzy"}});
    return Resolution{*fuzzy, ResolutionStrategy::kFuzzy};
  }
  return Resolution{Allocate(series), ResolutionStrategy::kAllocated};
}

} // namespace showlink
