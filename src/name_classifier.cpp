#include <showlink/name_classifier.h>

#include <showlink/episode_extractor.h>

#include <cctype>
#include <memory>
#include <regex>
#include <sstream>
#include <utility>

namespace showlink {
namespace {

NormalizationRule RegexRule(std::string name, const std::string &pattern,
                            std::string replacement) {
  auto expression = std::make_shared<const std::regex>(pattern);
  return NormalizationRule{
      std::move(name),
      [expression, replacement = std::move(replacement)](std::string value) {
        return std::regex_replace(value, *expression, replacement);
      }};
}

std::string RemoveCharacters(std::string value, const std::string &unwanted) {
  std::string kept;
  kept.reserve(value.size());
  for (const auto character : value) {
    if (unwanted.find(character) == std::string::npos) {
      kept.push_back(character);
    }
  }
  return kept;
}

} // namespace

std::vector<NormalizationRule> DefaultNormalizationRules() {
  std::vector<NormalizationRule> rules;
  rules.push_back(RegexRule("strip-numbered-suffix", " -[0-9]+[\\s.]*$", ""));
  rules.push_back(RegexRule("trim-trailing-separators", "[\\s-]+$", ""));
  rules.push_back(
      RegexRule("strip-season-words", "(Season|SEASON)[ .]?[0-9]+", " "));
  rules.push_back(RegexRule("strip-lone-s01",
                            "(^|[\\s.])S01(\\.\\s*-\\s*)?(?=[\\s.]|$)", "$1"));
  rules.push_back(
      RegexRule("strip-parenthetical-groups", "\\([^()]*\\)|[()]", " "));
  rules.push_back({"strip-quotes", [](std::string value) {
                     return RemoveCharacters(std::move(value), "'\"");
                   }});
  rules.push_back({"dots-to-spaces", [](std::string value) {
                     for (auto &character : value) {
                       if (character == '.') {
                         character = ' ';
                       }
                     }
                     return value;
                   }});
  rules.push_back(RegexRule("trim-edges", "^[\\s-]+|[\\s-]+$", ""));
  rules.push_back({"title-case", TitleCase});
  return rules;
}

std::optional<std::string> ExtractReleaseYear(const std::string &title) {
  static const std::regex kFourDigits("[0-9]{4}");
  std::optional<std::string> year;
  for (std::sregex_iterator it(title.begin(), title.end(), kFourDigits), end;
       it != end; ++it) {
    year = it->str();
  }
  return year;
}

std::string TitleCase(const std::string &value) {
  std::istringstream stream(value);
  std::string token;
  std::string result;
  while (stream >> token) {
    token[0] = static_cast<char>(
        std::toupper(static_cast<unsigned char>(token[0])));
    if (!result.empty()) {
      result.push_back(' ');
    }
    result.append(token);
  }
  return result;
}

NameClassifier::NameClassifier() : rules_(DefaultNormalizationRules()) {}

NameClassifier::NameClassifier(std::vector<NormalizationRule> rules)
    : rules_(std::move(rules)) {}

std::optional<ClassifiedSeries>
NameClassifier::Classify(const std::string &folder_name) const {
  // Greedy: the title is everything before the last season marker that is
  // still followed by a resolution marker.
  static const std::regex kSeasonAndResolution(
      "(.*)[Ss]([0-9]+).*[0-9]{3,4}p.*");
  std::smatch match;
  if (!std::regex_match(folder_name, match, kSeasonAndResolution)) {
    return std::nullopt;
  }

  const auto title = match[1].str();
  ClassifiedSeries series;
  series.year = ExtractReleaseYear(title);
  series.season = ParseNumber(match[2].str());

  std::string name = title;
  for (const auto &rule : rules_) {
    name = rule.apply(std::move(name));
  }
  if (name.empty()) {
    return std::nullopt;
  }
  series.name = std::move(name);
  return series;
}

} // namespace showlink
