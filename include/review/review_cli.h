#pragma once

#include <review/logging.h>
#include <review/models.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace review {

struct ReviewOptions {
  std::optional<std::filesystem::path> diff_file;
  std::optional<std::string> source;
  std::optional<std::string> language;
  std::optional<std::string> context;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> output_directory;
  std::vector<std::string> formats;
  std::optional<std::vector<std::string>> stages;
  std::optional<LogLevel> log_level;
  std::optional<long long> stage_timeout_ms;
  bool show_help = false;
};

ReviewOptions ParseReviewArguments(const std::vector<std::string> &arguments);
ReviewOptions ParseConfigFile(const std::filesystem::path &path);
ReviewOptions MergeOptions(const ReviewOptions &config_options,
                           const ReviewOptions &cli_options);
ReviewOptions ResolveReviewOptions(const ReviewOptions &cli_options);

// Reads the inline diff named by --diff ("-" reads `standard_input`); a
// --source reference is left for the diff source to resolve.
ReviewRequest BuildReviewRequest(const ReviewOptions &options,
                                 std::istream &standard_input);

int RunReview(const std::vector<std::string> &arguments);
int RunStagesCommand(const std::vector<std::string> &arguments);

} // namespace review
