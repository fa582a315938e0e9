#include <review/diff_parser.h>
#include <review/errors.h>

#include <charconv>
#include <limits>
#include <optional>
#include <regex>
#include <sstream>
#include <string_view>
#include <utility>

namespace review {
namespace {

constexpr std::string_view kOldFileMarker = "--- a/";
constexpr std::string_view kNewFileMarker = "+++ b/";
constexpr std::string_view kHunkMarker = "@@";
constexpr std::string_view kNoNewlineMarker = "\\";
// Enough for "@@ -<int>,<int> +<int>,<int> @@"; any section heading after it
// is not needed and is kept away from std::regex.
constexpr std::size_t kMaxHunkHeaderPrefix = 64;
constexpr long long kMaxLineNumber = std::numeric_limits<int>::max();

bool StartsWith(const std::string &line, std::string_view prefix) {
  return line.compare(0, prefix.size(), prefix) == 0;
}

std::optional<int> ToLineNumber(const std::string &digits) {
  int value = 0;
  const auto *begin = digits.data();
  const auto *end = digits.data() + digits.size();
  const auto [position, error] = std::from_chars(begin, end, value);
  if (error != std::errc{} || position != end) {
    return std::nullopt;
  }
  return value;
}

enum class ParserState { kNoFile, kInFile, kInHunk };

class ParseSession {
public:
  explicit ParseSession(const LanguageClassifier &classifier)
      : classifier_(&classifier) {}

  void Consume(const std::string &line) {
    if (StartsWith(line, kOldFileMarker)) {
      StartFile(line.substr(kOldFileMarker.size()));
      return;
    }
    if (StartsWith(line, kNewFileMarker)) {
      if (current_) {
        current_->new_path = line.substr(kNewFileMarker.size());
        state_ = ParserState::kInFile;
      }
      return;
    }
    if (StartsWith(line, kHunkMarker)) {
      StartHunk(line);
      return;
    }
    if (state_ == ParserState::kInHunk) {
      ConsumeHunkLine(line);
    }
  }

  std::vector<FileDiff> Finish() {
    FlushFile();
    return std::move(files_);
  }

private:
  void StartFile(std::string path) {
    FlushFile();
    current_ = FileDiff{};
    current_->old_path = std::move(path);
    state_ = ParserState::kInFile;
  }

  void FlushFile() {
    if (current_ && !current_->hunks.empty()) {
      current_->language = classifier_->Classify(current_->Path());
      files_.push_back(std::move(*current_));
    }
    current_.reset();
    state_ = ParserState::kNoFile;
  }

  void StartHunk(const std::string &line) {
    if (!current_) {
      return;
    }

    static const std::regex header_pattern(
        R"(^@@ -(\d+)(?:,\d+)? \+(\d+)(?:,\d+)? @@)");
    const auto header = line.substr(0, kMaxHunkHeaderPrefix);
    std::smatch match;
    if (!std::regex_search(header, match, header_pattern)) {
      state_ = ParserState::kInFile;
      return;
    }
    const auto old_start = ToLineNumber(match[1].str());
    const auto new_start = ToLineNumber(match[2].str());
    if (!old_start || !new_start) {
      state_ = ParserState::kInFile;
      return;
    }

    Hunk hunk;
    hunk.old_start = *old_start;
    hunk.new_start = *new_start;
    current_->hunks.push_back(std::move(hunk));
    old_line_ = *old_start;
    new_line_ = *new_start;
    state_ = ParserState::kInHunk;
  }

  // A line whose number would not fit in an int ends the hunk.
  void ConsumeHunkLine(const std::string &line) {
    auto &changes = current_->hunks.back().changes;
    if (StartsWith(line, "+") && !StartsWith(line, "+++")) {
      if (new_line_ > kMaxLineNumber) {
        state_ = ParserState::kInFile;
        return;
      }
      changes.push_back({ChangeKind::kAddition, static_cast<int>(new_line_++),
                         line.substr(1)});
      return;
    }
    if (StartsWith(line, "-") && !StartsWith(line, "---")) {
      if (old_line_ > kMaxLineNumber) {
        state_ = ParserState::kInFile;
        return;
      }
      changes.push_back({ChangeKind::kDeletion, static_cast<int>(old_line_++),
                         line.substr(1)});
      return;
    }
    if (StartsWith(line, " ")) {
      if (new_line_ > kMaxLineNumber) {
        state_ = ParserState::kInFile;
        return;
      }
      changes.push_back(
          {ChangeKind::kContext, static_cast<int>(new_line_), line.substr(1)});
      ++old_line_;
      ++new_line_;
      return;
    }
    // "\ No newline at end of file" annotates the previous line only.
    if (StartsWith(line, kNoNewlineMarker)) {
      return;
    }
    state_ = ParserState::kInFile;
  }

  const LanguageClassifier *classifier_;
  ParserState state_ = ParserState::kNoFile;
  std::optional<FileDiff> current_;
  std::vector<FileDiff> files_;
  long long old_line_ = 0;
  long long new_line_ = 0;
};

} // namespace

UnifiedDiffParser::UnifiedDiffParser(LanguageClassifier classifier)
    : classifier_(std::move(classifier)) {}

std::vector<FileDiff>
UnifiedDiffParser::Parse(const std::string &diff_text) const {
  if (diff_text.empty()) {
    throw ParseError("No diff content available to parse");
  }

  ParseSession session(classifier_);
  std::istringstream stream(diff_text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    session.Consume(line);
  }
  return session.Finish();
}

} // namespace review
