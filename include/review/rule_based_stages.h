#pragma once

#include <review/interfaces.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace review {

inline constexpr const char kLogicStage[] = "logic";
inline constexpr const char kSecurityStage[] = "security";
inline constexpr const char kPerformanceStage[] = "performance";
inline constexpr const char kReadabilityStage[] = "readability";

// Longest line a pattern rule is run against. std::regex recurses per input
// character, so longer lines would exhaust a stage thread's stack.
inline constexpr std::size_t kMaxScannedLineLength = 4096;

struct LineRule {
  ChangeKind applies_to = ChangeKind::kAddition;
  // Empty means every language.
  std::vector<std::string> languages;
  std::function<bool(const std::string &)> matches;
  // Longer lines are skipped; zero means no limit.
  std::size_t max_line_length = kMaxScannedLineLength;
  Severity severity = Severity::kWarning;
  std::string message;
  std::string suggestion;
};

// Flags changed lines that match any of its rules, one comment per rule hit.
// Rules see the file's own language tag, or the run's tag when the file's is
// unknown.
class RuleBasedStage : public AnalysisStage {
public:
  RuleBasedStage(std::string name, std::string category,
                 std::vector<LineRule> rules);

  std::string Name() const override { return name_; }
  std::vector<Comment> Analyze(const std::vector<FileDiff> &files,
                               const StageContext &context) override;

private:
  std::string name_;
  std::string category_;
  std::vector<LineRule> rules_;
};

std::unique_ptr<AnalysisStage> MakeLogicStage();
std::unique_ptr<AnalysisStage> MakeSecurityStage();
std::unique_ptr<AnalysisStage> MakePerformanceStage();
std::unique_ptr<AnalysisStage> MakeReadabilityStage();

} // namespace review
