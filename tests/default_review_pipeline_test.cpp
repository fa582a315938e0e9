#include <review/default_review_pipeline.h>
#include <review/errors.h>
#include <review/review_pipeline_builder.h>
#include <review/stage_registry.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace review {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::Throw;

constexpr char kPythonDiff[] = "--- a/service/handler.py\n"
                               "+++ b/service/handler.py\n"
                               "@@ -1,2 +1,3 @@\n"
                               " def handle():\n"
                               "-    pass\n"
                               "+    x = 1\n"
                               "+    return x\n";

class MockDiffSource : public DiffSource {
public:
  MOCK_METHOD(FetchedDiff, Fetch, (const std::string &reference), (override));
};

class StaticStage : public AnalysisStage {
public:
  StaticStage(std::string name, std::string message)
      : name_(std::move(name)), message_(std::move(message)) {}

  std::string Name() const override { return name_; }

  std::vector<Comment> Analyze(const std::vector<FileDiff> &files,
                               const StageContext &) override {
    std::vector<Comment> comments;
    for (const auto &file : files) {
      Comment comment;
      comment.file_path = file.Path();
      comment.line_number = 1;
      comment.severity = Severity::kWarning;
      comment.category = name_;
      comment.message = message_;
      comment.source_stage = name_;
      comments.push_back(comment);
    }
    return comments;
  }

private:
  std::string name_;
  std::string message_;
};

class ThrowingStage : public AnalysisStage {
public:
  std::string Name() const override { return "broken"; }
  std::vector<Comment> Analyze(const std::vector<FileDiff> &,
                               const StageContext &) override {
    throw std::runtime_error("backend unavailable");
  }
};

// Records what the pipeline handed to it.
class RecordingStage : public AnalysisStage {
public:
  std::string Name() const override { return "recording"; }
  std::vector<Comment> Analyze(const std::vector<FileDiff> &files,
                               const StageContext &context) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    files_ = files;
    language_ = context.language;
    notes_ = context.notes;
    return {};
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  std::string language() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return language_;
  }
  std::optional<std::string> notes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_;
  }
  std::vector<FileDiff> files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_;
  }

private:
  mutable std::mutex mutex_;
  int calls_ = 0;
  std::vector<FileDiff> files_;
  std::string language_;
  std::optional<std::string> notes_;
};

// Runs until asked to stop, giving up on its own after a few seconds.
class StallingStage : public AnalysisStage {
public:
  explicit StallingStage(std::shared_ptr<std::atomic<bool>> observed_stop)
      : observed_stop_(std::move(observed_stop)) {}

  std::string Name() const override { return "stalling"; }
  std::vector<Comment> Analyze(const std::vector<FileDiff> &files,
                               const StageContext &context) override {
    const auto give_up =
        std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!context.stop.stop_requested() &&
           std::chrono::steady_clock::now() < give_up) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    observed_stop_->store(context.stop.stop_requested());
    Comment late;
    late.file_path = files.empty() ? "none" : files.front().Path();
    late.message = "late finding";
    return {late};
  }

private:
  std::shared_ptr<std::atomic<bool>> observed_stop_;
};

// Throws something that is not a std::exception.
class NonStandardThrowingStage : public AnalysisStage {
public:
  std::string Name() const override { return "odd"; }
  std::vector<Comment> Analyze(const std::vector<FileDiff> &,
                               const StageContext &) override {
    throw 42;
  }
};

class SleepingStage : public StaticStage {
public:
  SleepingStage(std::string name, std::chrono::milliseconds delay)
      : StaticStage(name, name + " issue"), delay_(delay) {}

  std::vector<Comment> Analyze(const std::vector<FileDiff> &files,
                               const StageContext &context) override {
    std::this_thread::sleep_for(delay_);
    return StaticStage::Analyze(files, context);
  }

private:
  std::chrono::milliseconds delay_;
};

bool WaitFor(const std::atomic<bool> &flag) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!flag.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return flag.load();
}

ReviewRequest InlineRequest(std::string diff) {
  ReviewRequest request;
  request.diff = std::move(diff);
  return request;
}

TEST(DefaultReviewPipelineTest, FailingStageDoesNotAffectTheOthers) {
  PipelineComponents components;
  components.stages = {std::make_shared<StaticStage>("logic", "logic issue"),
                       std::make_shared<ThrowingStage>(),
                       std::make_shared<StaticStage>("security", "sec issue"),
                       std::make_shared<StaticStage>("style", "style issue")};
  DefaultReviewPipeline pipeline(std::move(components));

  const auto result = pipeline.Run(InlineRequest(kPythonDiff));

  EXPECT_EQ(result.report.status, ReviewStatus::kSuccess);
  EXPECT_TRUE(result.report.error.empty());
  EXPECT_EQ(result.report.total_issues, 3U);
  ASSERT_THAT(result.diagnostics, SizeIs(4));
  EXPECT_EQ(result.diagnostics[0].status, StageStatus::kOk);
  EXPECT_EQ(result.diagnostics[1].stage, "broken");
  EXPECT_EQ(result.diagnostics[1].status, StageStatus::kFailed);
  EXPECT_THAT(result.diagnostics[1].message, HasSubstr("backend unavailable"));
  EXPECT_EQ(result.diagnostics[2].comment_count, 1U);
  EXPECT_EQ(result.diagnostics[3].status, StageStatus::kOk);
}

TEST(DefaultReviewPipelineTest, TimedOutStageContributesNothingAndIsStopped) {
  auto observed_stop = std::make_shared<std::atomic<bool>>(false);
  PipelineComponents components;
  components.stages = {std::make_shared<StallingStage>(observed_stop),
                       std::make_shared<StaticStage>("logic", "logic issue")};
  components.stage_timeout = std::chrono::milliseconds(50);
  DefaultReviewPipeline pipeline(std::move(components));

  const auto result = pipeline.Run(InlineRequest(kPythonDiff));

  EXPECT_EQ(result.report.status, ReviewStatus::kSuccess);
  ASSERT_THAT(result.report.comments, SizeIs(1));
  EXPECT_EQ(result.report.comments[0].source_stage, "logic");
  ASSERT_THAT(result.diagnostics, SizeIs(2));
  EXPECT_EQ(result.diagnostics[0].status, StageStatus::kTimedOut);
  EXPECT_EQ(result.diagnostics[0].duration_ms, 50);
  EXPECT_EQ(result.diagnostics[1].status, StageStatus::kOk);
  EXPECT_TRUE(WaitFor(*observed_stop));
}

TEST(DefaultReviewPipelineTest, NonStandardExceptionFailsOnlyThatStage) {
  PipelineComponents components;
  components.stages = {std::make_shared<StaticStage>("logic", "logic issue"),
                       std::make_shared<NonStandardThrowingStage>(),
                       std::make_shared<StaticStage>("security", "sec issue")};
  DefaultReviewPipeline pipeline(std::move(components));

  const auto result = pipeline.Run(InlineRequest(kPythonDiff));

  EXPECT_EQ(result.report.status, ReviewStatus::kSuccess);
  ASSERT_THAT(result.report.comments, SizeIs(2));
  EXPECT_EQ(result.report.comments[0].source_stage, "logic");
  EXPECT_EQ(result.report.comments[1].source_stage, "security");
  ASSERT_THAT(result.diagnostics, SizeIs(3));
  EXPECT_EQ(result.diagnostics[1].stage, "odd");
  EXPECT_EQ(result.diagnostics[1].status, StageStatus::kFailed);
  EXPECT_EQ(result.diagnostics[1].message,
            "Stage raised a non-standard exception");
  EXPECT_EQ(result.diagnostics[0].status, StageStatus::kOk);
  EXPECT_EQ(result.diagnostics[2].status, StageStatus::kOk);
}

TEST(DefaultReviewPipelineTest, StagesRunConcurrentlyUnderOneDeadline) {
  const auto delay = std::chrono::milliseconds(150);
  PipelineComponents components;
  components.stages = {std::make_shared<SleepingStage>("logic", delay),
                       std::make_shared<SleepingStage>("security", delay),
                       std::make_shared<SleepingStage>("performance", delay),
                       std::make_shared<SleepingStage>("readability", delay)};
  components.stage_timeout = std::chrono::milliseconds(300);
  DefaultReviewPipeline pipeline(std::move(components));

  const auto started = std::chrono::steady_clock::now();
  const auto result = pipeline.Run(InlineRequest(kPythonDiff));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(result.report.status, ReviewStatus::kSuccess);
  EXPECT_EQ(result.report.total_issues, 4U);
  ASSERT_THAT(result.diagnostics, SizeIs(4));
  for (const auto &diagnostic : result.diagnostics) {
    EXPECT_EQ(diagnostic.status, StageStatus::kOk) << diagnostic.stage;
  }
  EXPECT_LT(elapsed, std::chrono::milliseconds(450));
}

TEST(DefaultReviewPipelineTest, VeryLongAddedLineIsReviewedByDefaultStages) {
  const auto registry = MakeStageRegistryWithDefaults();
  auto pipeline = ReviewPipelineBuilder(registry).Build();
  const std::string diff = "--- a/db/query.py\n"
                           "+++ b/db/query.py\n"
                           "@@ -1,1 +1,1 @@\n"
                           "+query = \"select " +
                           std::string(200000, 'a') + "\" + user_id\n";

  const auto result = pipeline.Run(InlineRequest(diff));

  EXPECT_EQ(result.report.status, ReviewStatus::kSuccess);
  ASSERT_THAT(result.diagnostics, SizeIs(registry.StageNames().size()));
  for (const auto &diagnostic : result.diagnostics) {
    EXPECT_EQ(diagnostic.status, StageStatus::kOk) << diagnostic.stage;
  }
  ASSERT_THAT(result.report.comments, SizeIs(1));
  EXPECT_EQ(result.report.comments[0].message, "Line exceeds 120 characters.");
}

TEST(DefaultReviewPipelineTest, FetchFailureEndsTheRunBeforeAnyStage) {
  auto source = std::make_unique<MockDiffSource>();
  EXPECT_CALL(*source, Fetch("missing.diff"))
      .WillOnce(Throw(FetchError("No analyzable text changes found")));
  auto stage = std::make_shared<RecordingStage>();
  PipelineComponents components;
  components.diff_source = std::move(source);
  components.stages = {stage};
  DefaultReviewPipeline pipeline(std::move(components));

  ReviewRequest request;
  request.reference = "missing.diff";
  const auto result = pipeline.Run(request);

  EXPECT_EQ(result.report.status, ReviewStatus::kFailed);
  EXPECT_EQ(result.report.error, "No analyzable text changes found");
  EXPECT_THAT(result.report.comments, IsEmpty());
  EXPECT_THAT(result.diagnostics, IsEmpty());
  EXPECT_EQ(stage->calls(), 0);
}

TEST(DefaultReviewPipelineTest, UnexpectedSourceErrorIsReportedAsFetchFailure) {
  auto source = std::make_unique<MockDiffSource>();
  EXPECT_CALL(*source, Fetch(_))
      .WillOnce(Throw(std::runtime_error("connection reset")));
  PipelineComponents components;
  components.diff_source = std::move(source);
  DefaultReviewPipeline pipeline(std::move(components));

  ReviewRequest request;
  request.reference = "remote";
  const auto result = pipeline.Run(request);

  EXPECT_EQ(result.report.status, ReviewStatus::kFailed);
  EXPECT_EQ(result.report.error, "connection reset");
  EXPECT_EQ(result.report.summary.text, "Review failed: connection reset");
}

TEST(DefaultReviewPipelineTest, ReferenceWithoutDiffSourceFails) {
  DefaultReviewPipeline pipeline(PipelineComponents{});

  ReviewRequest request;
  request.reference = "owner/repo#1";
  const auto result = pipeline.Run(request);

  EXPECT_EQ(result.report.status, ReviewStatus::kFailed);
  EXPECT_THAT(result.report.error, HasSubstr("No diff source configured"));
}

TEST(DefaultReviewPipelineTest, FetchedDiffIsParsedAndMetadataKept) {
  FetchedDiff fetched;
  fetched.metadata = {{"origin", "change.diff"}};
  fetched.text = kPythonDiff;
  auto source = std::make_unique<MockDiffSource>();
  EXPECT_CALL(*source, Fetch("change.diff")).WillOnce(Return(fetched));
  auto stage = std::make_shared<RecordingStage>();
  PipelineComponents components;
  components.diff_source = std::move(source);
  components.stages = {stage};
  DefaultReviewPipeline pipeline(std::move(components));

  ReviewRequest request;
  request.reference = "change.diff";
  request.diff = "ignored when a reference is present";
  const auto result = pipeline.Run(request);

  EXPECT_EQ(result.report.status, ReviewStatus::kSuccess);
  EXPECT_THAT(result.report.metadata,
              ElementsAre(std::make_pair(std::string("origin"),
                                         std::string("change.diff"))));
  ASSERT_THAT(stage->files(), SizeIs(1));
  EXPECT_EQ(stage->files()[0].Path(), "service/handler.py");
}

TEST(DefaultReviewPipelineTest, EmptyInlineDiffIsAParseFailure) {
  auto stage = std::make_shared<RecordingStage>();
  PipelineComponents components;
  components.stages = {stage};
  DefaultReviewPipeline pipeline(std::move(components));

  const auto result = pipeline.Run(ReviewRequest{});

  EXPECT_EQ(result.report.status, ReviewStatus::kFailed);
  EXPECT_EQ(result.report.error, "No diff content available to parse");
  EXPECT_EQ(result.report.total_issues, 0U);
  EXPECT_EQ(stage->calls(), 0);
}

TEST(DefaultReviewPipelineTest, ResolvesLanguageFromChangedPaths) {
  auto stage = std::make_shared<RecordingStage>();
  PipelineComponents components;
  components.stages = {stage};
  DefaultReviewPipeline pipeline(std::move(components));

  auto request = InlineRequest(kPythonDiff);
  request.context = "hotfix for the login flow";
  const auto result = pipeline.Run(request);

  EXPECT_EQ(result.report.language, "python");
  EXPECT_EQ(stage->language(), "python");
  EXPECT_EQ(stage->notes().value_or(""), "hotfix for the login flow");
}

TEST(DefaultReviewPipelineTest, LanguageHintTakesPrecedence) {
  auto stage = std::make_shared<RecordingStage>();
  PipelineComponents components;
  components.stages = {stage};
  DefaultReviewPipeline pipeline(std::move(components));

  auto request = InlineRequest(kPythonDiff);
  request.language = "cython";
  const auto result = pipeline.Run(request);

  EXPECT_EQ(result.report.language, "cython");
  EXPECT_EQ(stage->language(), "cython");
}

TEST(DefaultReviewPipelineTest, LogsLifecycleEvents) {
  std::stringstream stream;
  PipelineComponents components;
  components.stages = {std::make_shared<ThrowingStage>()};
  components.logger = MakeLogger({LogLevel::kDebug}, stream);
  DefaultReviewPipeline pipeline(std::move(components));

  pipeline.Run(InlineRequest(kPythonDiff));

  const auto output = stream.str();
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.start\""));
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.parse.complete\""));
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.stage.failed\""));
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.complete\""));
}

TEST(DefaultReviewPipelineTest, RejectsInvalidComponents) {
  PipelineComponents zero_timeout;
  zero_timeout.stage_timeout = std::chrono::milliseconds(0);
  EXPECT_THROW(DefaultReviewPipeline{std::move(zero_timeout)},
               std::invalid_argument);

  PipelineComponents null_stage;
  null_stage.stages.push_back(nullptr);
  EXPECT_THROW(DefaultReviewPipeline{std::move(null_stage)},
               std::invalid_argument);
}

TEST(ReviewPipelineBuilderTest, DefaultsToEveryRegisteredStage) {
  const auto registry = MakeStageRegistryWithDefaults();
  auto pipeline = ReviewPipelineBuilder(registry).Build();

  EXPECT_EQ(pipeline.StageNames(), registry.StageNames());
  EXPECT_EQ(pipeline.StageTimeout(), kDefaultStageTimeout);
}

TEST(ReviewPipelineBuilderTest, AppendsNamedStagesAfterExplicitOnes) {
  const auto registry = MakeStageRegistryWithDefaults();
  auto pipeline =
      ReviewPipelineBuilder(registry)
          .WithStage(std::make_unique<StaticStage>("custom", "custom issue"))
          .WithStageNames({"security", "logic"})
          .WithStageTimeout(std::chrono::milliseconds(250))
          .Build();

  EXPECT_THAT(pipeline.StageNames(),
              ElementsAre("custom", "security", "logic"));
  EXPECT_EQ(pipeline.StageTimeout(), std::chrono::milliseconds(250));
}

TEST(ReviewPipelineBuilderTest, ExplicitStagesAloneSkipTheRegistry) {
  const auto registry = MakeStageRegistryWithDefaults();
  auto pipeline =
      ReviewPipelineBuilder(registry)
          .WithStage(std::make_unique<StaticStage>("custom", "custom issue"))
          .Build();

  EXPECT_THAT(pipeline.StageNames(), ElementsAre("custom"));
}

TEST(ReviewPipelineBuilderTest, RejectsUnknownStagesAndBadTimeouts) {
  const auto registry = MakeStageRegistryWithDefaults();

  EXPECT_THROW(ReviewPipelineBuilder(registry).WithStageNames({"typo"}).Build(),
               std::invalid_argument);
  EXPECT_THROW(ReviewPipelineBuilder(registry).WithStage(nullptr),
               std::invalid_argument);
  EXPECT_THROW(ReviewPipelineBuilder(registry).WithStageTimeout(
                   std::chrono::milliseconds(-1)),
               std::invalid_argument);
}

} // namespace
} // namespace review
