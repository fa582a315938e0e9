#pragma once

#include <review/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace review {

class StageRegistry {
public:
  using StageFactory = std::function<std::unique_ptr<AnalysisStage>()>;

  void RegisterStage(const std::string &name, StageFactory factory);

  std::unique_ptr<AnalysisStage> CreateStage(const std::string &name) const;
  std::vector<std::unique_ptr<AnalysisStage>>
  CreateStages(const std::vector<std::string> &names) const;

  // Names in registration order.
  std::vector<std::string> StageNames() const;
  bool Contains(const std::string &name) const;

private:
  std::string JoinNames() const;

  std::vector<std::pair<std::string, StageFactory>> factories_;
};

StageRegistry MakeStageRegistryWithDefaults();
const StageRegistry &GlobalStageRegistry();

} // namespace review
