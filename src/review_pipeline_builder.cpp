#include <review/review_pipeline_builder.h>

#include <stdexcept>
#include <utility>

namespace review {

ReviewPipelineBuilder::ReviewPipelineBuilder(const StageRegistry &registry)
    : registry_(&registry) {}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithDiffSource(std::unique_ptr<DiffSource> source) {
  components_.diff_source = std::move(source);
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithStage(std::unique_ptr<AnalysisStage> stage) {
  if (!stage) {
    throw std::invalid_argument("Analysis stage cannot be null");
  }
  components_.stages.push_back(std::move(stage));
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithStageNames(std::vector<std::string> names) {
  stage_names_ = std::move(names);
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithStageTimeout(std::chrono::milliseconds timeout) {
  if (timeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("Stage timeout must be positive");
  }
  components_.stage_timeout = timeout;
  return *this;
}

DefaultReviewPipeline ReviewPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));

  std::vector<std::string> names;
  if (stage_names_) {
    names = *stage_names_;
  } else if (components_.stages.empty()) {
    names = registry_->StageNames();
  }
  for (auto &stage : registry_->CreateStages(names)) {
    components_.stages.push_back(std::move(stage));
  }

  return DefaultReviewPipeline(std::move(components_));
}

} // namespace review
