#include <review/cli_exit_codes.h>

#include <gtest/gtest.h>

namespace review {
namespace {

ReviewReport ReportWith(std::initializer_list<Severity> severities) {
  ReviewReport report;
  for (const auto severity : severities) {
    Comment comment;
    comment.file_path = "a.py";
    comment.severity = severity;
    comment.message = "finding";
    report.comments.push_back(comment);
  }
  report.total_issues = report.comments.size();
  return report;
}

TEST(ExitCodeTest, CleanWhenOnlyAdvisoryFindings) {
  EXPECT_EQ(ReviewExitCode(ReportWith({})), kExitClean);
  EXPECT_EQ(ReviewExitCode(ReportWith({Severity::kWarning, Severity::kInfo,
                                       Severity::kUnknown})),
            kExitClean);
}

TEST(ExitCodeTest, BlockingFindingsReturnTwo) {
  EXPECT_EQ(ReviewExitCode(ReportWith({Severity::kInfo, Severity::kError})),
            kExitBlockingFindings);
  EXPECT_EQ(ReviewExitCode(ReportWith({Severity::kCritical})),
            kExitBlockingFindings);
}

TEST(ExitCodeTest, FailedRunReturnsOne) {
  auto report = ReportWith({});
  report.status = ReviewStatus::kFailed;
  report.error = "No diff content available to parse";

  EXPECT_EQ(ReviewExitCode(report), kExitFailure);
}

} // namespace
} // namespace review
