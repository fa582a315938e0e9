#pragma once

#include <review/models.h>

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace review {

struct StageContext {
  std::string language = "unknown";
  std::optional<std::string> notes;
  std::stop_token stop;
};

class DiffSource {
public:
  virtual ~DiffSource() = default;
  virtual FetchedDiff Fetch(const std::string &reference) = 0;
};

class AnalysisStage {
public:
  virtual ~AnalysisStage() = default;
  virtual std::string Name() const = 0;
  virtual std::vector<Comment> Analyze(const std::vector<FileDiff> &files,
                                       const StageContext &context) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const ReviewReport &report,
                        const std::vector<std::string> &formats) = 0;
};

class ReviewPipeline {
public:
  virtual ~ReviewPipeline() = default;
  virtual PipelineResult Run(const ReviewRequest &request) = 0;
};

} // namespace review
