#include <review/stage_registry.h>

#include <review/rule_based_stages.h>

#include <algorithm>
#include <stdexcept>

namespace review {

void StageRegistry::RegisterStage(const std::string &name,
                                  StageFactory factory) {
  if (name.empty()) {
    throw std::invalid_argument("Stage name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for stage '" + name +
                                "' cannot be null");
  }
  if (Contains(name)) {
    throw std::invalid_argument("Stage with name '" + name +
                                "' already registered");
  }
  factories_.emplace_back(name, std::move(factory));
}

std::unique_ptr<AnalysisStage>
StageRegistry::CreateStage(const std::string &name) const {
  const auto found =
      std::find_if(factories_.begin(), factories_.end(),
                   [&](const auto &entry) { return entry.first == name; });
  if (found == factories_.end()) {
    throw std::invalid_argument("Unknown stage '" + name +
                                "'. Registered: " + JoinNames());
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for stage '" + name +
                             "' returned null");
  }
  return instance;
}

std::vector<std::unique_ptr<AnalysisStage>>
StageRegistry::CreateStages(const std::vector<std::string> &names) const {
  std::vector<std::unique_ptr<AnalysisStage>> stages;
  stages.reserve(names.size());
  for (const auto &name : names) {
    stages.push_back(CreateStage(name));
  }
  return stages;
}

std::vector<std::string> StageRegistry::StageNames() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto &entry : factories_) {
    names.push_back(entry.first);
  }
  return names;
}

bool StageRegistry::Contains(const std::string &name) const {
  return std::any_of(factories_.begin(), factories_.end(),
                     [&](const auto &entry) { return entry.first == name; });
}

std::string StageRegistry::JoinNames() const {
  std::string message;
  for (std::size_t i = 0; i < factories_.size(); ++i) {
    message += factories_[i].first;
    if (i + 1 < factories_.size()) {
      message += ", ";
    }
  }
  return message;
}

StageRegistry MakeStageRegistryWithDefaults() {
  StageRegistry registry;
  registry.RegisterStage(kLogicStage, MakeLogicStage);
  registry.RegisterStage(kSecurityStage, MakeSecurityStage);
  registry.RegisterStage(kPerformanceStage, MakePerformanceStage);
  registry.RegisterStage(kReadabilityStage, MakeReadabilityStage);
  return registry;
}

const StageRegistry &GlobalStageRegistry() {
  static const StageRegistry registry = MakeStageRegistryWithDefaults();
  return registry;
}

} // namespace review
