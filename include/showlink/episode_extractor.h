#pragma once

#include <showlink/models.h>

#include <optional>
#include <string>
#include <string_view>

namespace showlink {

std::optional<int> ParseNumber(std::string_view digits);

std::optional<int> ExtractSeason(const std::string &name);

std::optional<EpisodeRef> ExtractEpisode(const std::string &name);

std::string SeasonFolderName(int season);

} // namespace showlink
