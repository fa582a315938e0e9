#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace review {

enum class ChangeKind { kAddition, kDeletion, kContext };

enum class Severity { kCritical, kError, kWarning, kInfo, kUnknown };

// Additions and context lines carry the post-image line number, deletions the
// pre-image line number.
struct ChangeLine {
  ChangeKind kind = ChangeKind::kContext;
  int line_number = 0;
  std::string content;

  bool operator==(const ChangeLine &) const = default;
};

struct Hunk {
  int old_start = 0;
  int new_start = 0;
  std::vector<ChangeLine> changes;

  bool operator==(const Hunk &) const = default;
};

struct FileDiff {
  std::string old_path;
  std::optional<std::string> new_path;
  std::string language = "unknown";
  std::vector<Hunk> hunks;

  // Post-image path when the diff names one, otherwise the pre-image path.
  const std::string &Path() const { return new_path ? *new_path : old_path; }

  bool operator==(const FileDiff &) const = default;
};

struct Comment {
  std::string file_path;
  std::optional<int> line_number;
  Severity severity = Severity::kInfo;
  std::string category;
  std::string message;
  std::optional<std::string> suggestion;
  std::string source_stage;

  bool operator==(const Comment &) const = default;
};

using Metadata = std::vector<std::pair<std::string, std::string>>;

struct ReviewRequest {
  std::optional<std::string> reference;
  std::optional<std::string> diff;
  std::optional<std::string> language;
  std::optional<std::string> context;
};

struct FetchedDiff {
  Metadata metadata;
  std::string text;
};

struct ReviewSummary {
  std::size_t total_issues = 0;
  std::map<std::string, std::size_t> by_severity;
  std::map<std::string, std::size_t> by_category;
  std::string text;
};

enum class ReviewStatus { kSuccess, kFailed };

struct ReviewReport {
  ReviewStatus status = ReviewStatus::kSuccess;
  std::string error;
  std::vector<Comment> comments;
  std::size_t total_issues = 0;
  ReviewSummary summary;
  Metadata metadata;
  std::string language = "unknown";
};

enum class StageStatus { kOk, kFailed, kTimedOut };

struct StageDiagnostic {
  std::string stage;
  StageStatus status = StageStatus::kOk;
  std::size_t comment_count = 0;
  long long duration_ms = 0;
  std::string message;
};

struct PipelineResult {
  ReviewReport report;
  std::vector<StageDiagnostic> diagnostics;
};

struct Report {
  std::string markdown;
  std::string json;
};

std::string SeverityName(Severity severity);
Severity ParseSeverity(const std::string &value);
int SeverityRank(Severity severity);
std::string ChangeKindName(ChangeKind kind);
std::string StageStatusName(StageStatus status);

} // namespace review
