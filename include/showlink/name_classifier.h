#pragma once

#include <showlink/models.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace showlink {

struct NormalizationRule {
  std::string name;
  std::function<std::string(std::string)> apply;
};

std::vector<NormalizationRule> DefaultNormalizationRules();

std::optional<std::string> ExtractReleaseYear(const std::string &title);

std::string TitleCase(const std::string &value);

class NameClassifier {
public:
  NameClassifier();
  explicit NameClassifier(std::vector<NormalizationRule> rules);

  std::optional<ClassifiedSeries> Classify(const std::string &folder_name) const;

  const std::vector<NormalizationRule> &Rules() const { return rules_; }

private:
  std::vector<NormalizationRule> rules_;
};

} // namespace showlink
