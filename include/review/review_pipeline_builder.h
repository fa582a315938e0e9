#pragma once

#include <review/default_review_pipeline.h>
#include <review/interfaces.h>
#include <review/logging.h>
#include <review/stage_registry.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace review {

class ReviewPipelineBuilder {
public:
  explicit ReviewPipelineBuilder(
      const StageRegistry &registry = GlobalStageRegistry());

  ReviewPipelineBuilder &WithDiffSource(std::unique_ptr<DiffSource> source);
  ReviewPipelineBuilder &WithStage(std::unique_ptr<AnalysisStage> stage);
  ReviewPipelineBuilder &WithStageNames(std::vector<std::string> names);
  ReviewPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  ReviewPipelineBuilder &WithStageTimeout(std::chrono::milliseconds timeout);

  // Stages named through WithStageNames are created from the registry and run
  // after any stage added directly. When neither is given, every registered
  // stage runs.
  DefaultReviewPipeline Build();

private:
  const StageRegistry *registry_;
  std::optional<std::vector<std::string>> stage_names_;
  PipelineComponents components_;
};

} // namespace review
