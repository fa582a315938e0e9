#pragma once

#include <review/diff_parser.h>
#include <review/interfaces.h>
#include <review/language_classifier.h>
#include <review/logging.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace review {

inline constexpr std::chrono::milliseconds kDefaultStageTimeout{30000};

struct PipelineComponents {
  std::unique_ptr<DiffSource> diff_source;
  std::vector<std::shared_ptr<AnalysisStage>> stages;
  std::shared_ptr<Logger> logger;
  std::chrono::milliseconds stage_timeout = kDefaultStageTimeout;
};

// Fetches or takes the diff, parses it once, fans the parsed files out to
// every stage on its own thread and aggregates whatever came back in time.
//
// Only a failed fetch and a failed parse end the run early. A stage that
// throws or overruns its timeout contributes no comments and is reported in
// PipelineResult::diagnostics. Overrunning stages are asked to stop through
// StageContext::stop and are not waited for; they keep their own reference
// to the stage and the parsed files until they return. All stages share one
// deadline taken when dispatch begins, so they must all be started together.
class DefaultReviewPipeline : public ReviewPipeline {
public:
  explicit DefaultReviewPipeline(PipelineComponents components);

  PipelineResult Run(const ReviewRequest &request) override;

  const std::vector<std::string> &StageNames() const { return stage_names_; }
  std::chrono::milliseconds StageTimeout() const { return stage_timeout_; }

private:
  struct StageOutcome {
    std::vector<Comment> comments;
    StageDiagnostic diagnostic;
  };

  FetchedDiff FetchDiff(const std::string &reference);
  std::vector<StageOutcome>
  Dispatch(std::shared_ptr<const std::vector<FileDiff>> files,
           const std::string &language,
           const std::optional<std::string> &notes);
  PipelineResult Fail(const std::string &error, Metadata metadata);

  std::unique_ptr<DiffSource> diff_source_;
  std::vector<std::shared_ptr<AnalysisStage>> stages_;
  std::vector<std::string> stage_names_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds stage_timeout_;
  UnifiedDiffParser parser_;
  LanguageClassifier classifier_;
};

} // namespace review
