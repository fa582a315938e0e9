#include <review/file_diff_source.h>

#include <review/errors.h>

#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <utility>

namespace review {
namespace {

std::string ReadAll(std::istream &stream) {
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

std::string ReadDiffFile(const std::string &reference) {
  const std::filesystem::path path(reference);
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    throw FetchError("Diff file not found: " + path.string());
  }
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw FetchError("Failed to open diff file: " + path.string());
  }
  return ReadAll(stream);
}

bool ContainsFileHeader(const std::string &text) {
  return text.rfind("--- a/", 0) == 0 ||
         text.find("\n--- a/") != std::string::npos;
}

} // namespace

FileDiffSource::FileDiffSource(std::istream &standard_input,
                               std::shared_ptr<Logger> logger)
    : standard_input_(&standard_input),
      logger_(EnsureLogger(std::move(logger))) {}

FetchedDiff FileDiffSource::Fetch(const std::string &reference) {
  if (reference.empty()) {
    throw FetchError("Diff reference cannot be empty");
  }

  FetchedDiff fetched;
  if (reference == kStandardInputReference) {
    fetched.text = ReadAll(*standard_input_);
  } else {
    fetched.text = ReadDiffFile(reference);
  }

  if (!ContainsFileHeader(fetched.text)) {
    throw FetchError("No analyzable text changes found in '" + reference +
                     "'. The diff may be empty or contain only binary "
                     "files.");
  }

  fetched.metadata = {{"origin", reference},
                      {"bytes", std::to_string(fetched.text.size())}};
  logger_->Log(LogLevel::kDebug, "source.fetch.complete",
               {{"origin", reference},
                {"bytes", std::to_string(fetched.text.size())}});
  return fetched;
}

} // namespace review
