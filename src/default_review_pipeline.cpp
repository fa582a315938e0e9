#include <review/default_review_pipeline.h>

#include <review/aggregator.h>
#include <review/errors.h>

#include <future>
#include <stdexcept>
#include <iterator>
#include <stop_token>
#include <system_error>
#include <thread>
#include <utility>

namespace review {
namespace {

using Clock = std::chrono::steady_clock;

struct StageRun {
  std::vector<Comment> comments;
  long long duration_ms = 0;
};

struct PendingStage {
  std::string name;
  std::future<StageRun> result;
  std::stop_source stop;
};

long long MillisecondsSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start)
      .count();
}

std::vector<std::string> FilePaths(const std::vector<FileDiff> &files) {
  std::vector<std::string> paths;
  paths.reserve(files.size());
  for (const auto &file : files) {
    paths.push_back(file.Path());
  }
  return paths;
}

} // namespace

DefaultReviewPipeline::DefaultReviewPipeline(PipelineComponents components)
    : diff_source_(std::move(components.diff_source)),
      stages_(std::move(components.stages)),
      logger_(EnsureLogger(std::move(components.logger))),
      stage_timeout_(components.stage_timeout) {
  if (stage_timeout_ <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("Stage timeout must be positive");
  }
  stage_names_.reserve(stages_.size());
  for (const auto &stage : stages_) {
    if (!stage) {
      throw std::invalid_argument("Analysis stage cannot be null");
    }
    stage_names_.push_back(stage->Name());
  }
}

PipelineResult DefaultReviewPipeline::Run(const ReviewRequest &request) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"entry", request.reference ? "fetch" : "inline"},
                {"stages", std::to_string(stages_.size())}});
  const auto pipeline_start = Clock::now();

  Metadata metadata;
  std::string diff_text;
  if (request.reference) {
    try {
      auto fetched = FetchDiff(*request.reference);
      metadata = std::move(fetched.metadata);
      diff_text = std::move(fetched.text);
    } catch (const FetchError &error) {
      return Fail(error.what(), {});
    }
    logger_->Log(LogLevel::kDebug, "pipeline.fetch.complete",
                 {{"reference", *request.reference},
                  {"bytes", std::to_string(diff_text.size())}});
  } else {
    diff_text = request.diff.value_or("");
  }

  std::vector<FileDiff> files;
  try {
    files = parser_.Parse(diff_text);
  } catch (const ParseError &error) {
    return Fail(error.what(), std::move(metadata));
  }
  logger_->Log(LogLevel::kDebug, "pipeline.parse.complete",
               {{"files", std::to_string(files.size())}});

  std::string language;
  if (request.language && !request.language->empty()) {
    language = *request.language;
  } else {
    language = classifier_.ClassifyPrimary(FilePaths(files));
    logger_->Log(LogLevel::kDebug, "pipeline.language.resolved",
                 {{"language", language}});
  }

  auto snapshot =
      std::make_shared<const std::vector<FileDiff>>(std::move(files));
  auto outcomes = Dispatch(std::move(snapshot), language, request.context);

  PipelineResult result;
  std::vector<Comment> collected;
  for (auto &outcome : outcomes) {
    collected.insert(collected.end(),
                     std::make_move_iterator(outcome.comments.begin()),
                     std::make_move_iterator(outcome.comments.end()));
    result.diagnostics.push_back(std::move(outcome.diagnostic));
  }

  result.report = Aggregate(collected, logger_);
  result.report.metadata = std::move(metadata);
  result.report.language = language;

  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(MillisecondsSince(pipeline_start))},
                {"comments", std::to_string(result.report.total_issues)}});
  return result;
}

FetchedDiff DefaultReviewPipeline::FetchDiff(const std::string &reference) {
  if (!diff_source_) {
    throw FetchError("No diff source configured for reference '" + reference +
                     "'");
  }
  try {
    return diff_source_->Fetch(reference);
  } catch (const FetchError &) {
    throw;
  } catch (const std::exception &error) {
    throw FetchError(error.what());
  }
}

std::vector<DefaultReviewPipeline::StageOutcome> DefaultReviewPipeline::Dispatch(
    std::shared_ptr<const std::vector<FileDiff>> files,
    const std::string &language, const std::optional<std::string> &notes) {
  const auto dispatched_at = Clock::now();
  const auto deadline = dispatched_at + stage_timeout_;

  std::vector<PendingStage> pending_stages;
  std::vector<StageOutcome> outcomes(stages_.size());
  pending_stages.reserve(stages_.size());
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    PendingStage pending;
    pending.name = stage_names_[i];
    outcomes[i].diagnostic.stage = pending.name;

    std::promise<StageRun> promise;
    pending.result = promise.get_future();
    StageContext context{language, notes, pending.stop.get_token()};
    try {
      std::thread([stage = stages_[i], files, context = std::move(context),
                   promise = std::move(promise)]() mutable {
        const auto started = Clock::now();
        try {
          StageRun run;
          run.comments = stage->Analyze(*files, context);
          run.duration_ms = MillisecondsSince(started);
          promise.set_value(std::move(run));
        } catch (...) {
          promise.set_exception(std::current_exception());
        }
      }).detach();
    } catch (const std::system_error &error) {
      outcomes[i].diagnostic.status = StageStatus::kFailed;
      outcomes[i].diagnostic.message = error.what();
      logger_->Log(LogLevel::kWarn, "pipeline.stage.failed",
                   {{"stage", pending.name}, {"error", error.what()}});
    }
    pending_stages.push_back(std::move(pending));
  }

  for (std::size_t i = 0; i < pending_stages.size(); ++i) {
    auto &pending = pending_stages[i];
    auto &outcome = outcomes[i];
    if (!pending.result.valid() ||
        outcome.diagnostic.status == StageStatus::kFailed) {
      continue;
    }

    if (pending.result.wait_until(deadline) != std::future_status::ready) {
      pending.stop.request_stop();
      outcome.diagnostic.status = StageStatus::kTimedOut;
      outcome.diagnostic.duration_ms = stage_timeout_.count();
      outcome.diagnostic.message =
          "Timed out after " + std::to_string(stage_timeout_.count()) + " ms";
      logger_->Log(LogLevel::kWarn, "pipeline.stage.timeout",
                   {{"stage", pending.name},
                    {"timeout_ms", std::to_string(stage_timeout_.count())}});
      continue;
    }

    try {
      auto run = pending.result.get();
      outcome.comments = std::move(run.comments);
      outcome.diagnostic.status = StageStatus::kOk;
      outcome.diagnostic.comment_count = outcome.comments.size();
      outcome.diagnostic.duration_ms = run.duration_ms;
      logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
                   {{"stage", pending.name},
                    {"comments", std::to_string(outcome.comments.size())},
                    {"duration_ms", std::to_string(run.duration_ms)}});
    } catch (const std::exception &error) {
      outcome.diagnostic.status = StageStatus::kFailed;
      outcome.diagnostic.duration_ms = MillisecondsSince(dispatched_at);
      outcome.diagnostic.message = error.what();
      logger_->Log(LogLevel::kWarn, "pipeline.stage.failed",
                   {{"stage", pending.name}, {"error", error.what()}});
    } catch (...) {
      outcome.diagnostic.status = StageStatus::kFailed;
      outcome.diagnostic.duration_ms = MillisecondsSince(dispatched_at);
      outcome.diagnostic.message = "Stage raised a non-standard exception";
      logger_->Log(LogLevel::kWarn, "pipeline.stage.failed",
                   {{"stage", pending.name},
                    {"error", outcome.diagnostic.message}});
    }
  }
  return outcomes;
}

PipelineResult DefaultReviewPipeline::Fail(const std::string &error,
                                           Metadata metadata) {
  logger_->Log(LogLevel::kError, "pipeline.failed", {{"error", error}});
  PipelineResult result;
  result.report.status = ReviewStatus::kFailed;
  result.report.error = error;
  result.report.metadata = std::move(metadata);
  result.report.summary.text = "Review failed: " + error;
  return result;
}

} // namespace review
