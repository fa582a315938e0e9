#include <review/models.h>

#include <algorithm>
#include <cctype>

namespace review {

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kCritical:
    return "critical";
  case Severity::kError:
    return "error";
  case Severity::kWarning:
    return "warning";
  case Severity::kInfo:
    return "info";
  case Severity::kUnknown:
    return "unknown";
  }
  return "unknown";
}

Severity ParseSeverity(const std::string &value) {
  std::string normalized = value;
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized == "critical") {
    return Severity::kCritical;
  }
  if (normalized == "error") {
    return Severity::kError;
  }
  if (normalized == "warning" || normalized == "warn") {
    return Severity::kWarning;
  }
  if (normalized == "info") {
    return Severity::kInfo;
  }
  return Severity::kUnknown;
}

int SeverityRank(Severity severity) {
  switch (severity) {
  case Severity::kCritical:
    return 0;
  case Severity::kError:
    return 1;
  case Severity::kWarning:
    return 2;
  case Severity::kInfo:
    return 3;
  case Severity::kUnknown:
    return 4;
  }
  return 4;
}

std::string ChangeKindName(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::kAddition:
    return "addition";
  case ChangeKind::kDeletion:
    return "deletion";
  case ChangeKind::kContext:
    return "context";
  }
  return "context";
}

std::string StageStatusName(StageStatus status) {
  switch (status) {
  case StageStatus::kOk:
    return "ok";
  case StageStatus::kFailed:
    return "failed";
  case StageStatus::kTimedOut:
    return "timed-out";
  }
  return "failed";
}

} // namespace review
