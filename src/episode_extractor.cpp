#include <showlink/episode_extractor.h>

#include <charconv>
#include <iomanip>
#include <regex>
#include <sstream>

namespace showlink {

std::optional<int> ParseNumber(std::string_view digits) {
  if (digits.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const auto *end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<int> ExtractSeason(const std::string &name) {
  static const std::regex kSeasonMarker("[Ss]([0-9]+)");
  std::smatch match;
  if (!std::regex_search(name, match, kSeasonMarker)) {
    return std::nullopt;
  }
  return ParseNumber(match[1].str());
}

std::optional<EpisodeRef> ExtractEpisode(const std::string &name) {
  static const std::regex kEpisodeMarker("[Ss]([0-9]+)[Ee]([0-9]+)");
  std::smatch match;
  if (!std::regex_search(name, match, kEpisodeMarker)) {
    return std::nullopt;
  }
  const auto season = ParseNumber(match[1].str());
  const auto episode = ParseNumber(match[2].str());
  if (!season || !episode) {
    return std::nullopt;
  }
  return EpisodeRef{*season, *episode};
}

std::string SeasonFolderName(int season) {
  std::ostringstream stream;
  stream << "Season " << std::setw(2) << std::setfill('0') << season;
  return stream.str();
}

} // namespace showlink
