#include <review/cli_exit_codes.h>

#include <algorithm>

namespace review {

int ReviewExitCode(const ReviewReport &report) {
  switch (report.status) {
  case ReviewStatus::kFailed:
    return kExitFailure;
  case ReviewStatus::kSuccess:
    break;
  }
  const bool blocking = std::any_of(
      report.comments.begin(), report.comments.end(), [](const Comment &c) {
        return c.severity == Severity::kCritical ||
               c.severity == Severity::kError;
      });
  return blocking ? kExitBlockingFindings : kExitClean;
}

} // namespace review
