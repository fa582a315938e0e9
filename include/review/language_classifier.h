#pragma once

#include <string>
#include <vector>

namespace review {

inline constexpr const char kUnknownLanguage[] = "unknown";

class LanguageClassifier {
public:
  // Maps a path to a language tag by special file name, then by extension.
  // Returns "unknown" for empty or unmapped paths.
  std::string Classify(const std::string &path) const;

  // Most frequent known tag across `paths`; on a tie the tag seen first in
  // `paths` wins. Returns "unknown" when no path is known.
  std::string ClassifyPrimary(const std::vector<std::string> &paths) const;
};

} // namespace review
