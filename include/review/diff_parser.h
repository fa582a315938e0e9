#pragma once

#include <review/language_classifier.h>
#include <review/models.h>

#include <string>
#include <vector>

namespace review {

// Reconstructs per-file, per-hunk change records from unified diff text.
//
// Files start at a "--- a/<path>" line and pick up their post-image path from
// the following "+++ b/<path>" line. Each "@@ -o[,n] +s[,m] @@" header opens a
// hunk whose line counters are seeded from `o` and `s`; hunk bodies are
// classified by their first character. Files without hunks are dropped and
// malformed hunk headers are skipped, so only empty input is an error. A hunk
// ends early at a line whose number would not fit in an int.
class UnifiedDiffParser {
public:
  explicit UnifiedDiffParser(LanguageClassifier classifier = {});

  // Throws ParseError when `diff_text` is empty.
  std::vector<FileDiff> Parse(const std::string &diff_text) const;

private:
  LanguageClassifier classifier_;
};

} // namespace review
