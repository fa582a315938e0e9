#include <review/aggregator.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>

namespace review {
namespace {

std::string Trim(const std::string &value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  const auto end =
      std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::vector<Comment> Deduplicate(const std::vector<Comment> &comments) {
  std::set<std::pair<std::string, std::string>> seen;
  std::vector<Comment> unique;
  unique.reserve(comments.size());
  for (const auto &comment : comments) {
    auto key = std::make_pair(comment.file_path,
                              NormalizeMessage(comment.message));
    if (seen.insert(std::move(key)).second) {
      unique.push_back(comment);
    }
  }
  return unique;
}

void Rank(std::vector<Comment> &comments) {
  std::stable_sort(comments.begin(), comments.end(),
                   [](const Comment &lhs, const Comment &rhs) {
                     const auto lhs_rank = SeverityRank(lhs.severity);
                     const auto rhs_rank = SeverityRank(rhs.severity);
                     const auto lhs_line = lhs.line_number.value_or(0);
                     const auto rhs_line = rhs.line_number.value_or(0);
                     return std::tie(lhs_rank, lhs.file_path, lhs_line) <
                            std::tie(rhs_rank, rhs.file_path, rhs_line);
                   });
}

std::string Capitalize(std::string value) {
  if (!value.empty()) {
    value.front() = static_cast<char>(
        std::toupper(static_cast<unsigned char>(value.front())));
  }
  return value;
}

} // namespace

std::string NormalizeMessage(const std::string &message) {
  auto normalized = Trim(message);
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

ReviewSummary Summarize(const std::vector<Comment> &comments) {
  ReviewSummary summary;
  summary.total_issues = comments.size();
  for (const auto &comment : comments) {
    ++summary.by_severity[SeverityName(comment.severity)];
    ++summary.by_category[comment.category];
  }
  summary.text = SummaryText(summary);
  return summary;
}

std::string SummaryText(const ReviewSummary &summary) {
  if (summary.total_issues == 0) {
    return "No issues found. Code looks good!";
  }

  const auto count_of = [&](const char *severity) -> std::size_t {
    const auto found = summary.by_severity.find(severity);
    return found == summary.by_severity.end() ? 0 : found->second;
  };

  std::ostringstream text;
  text << "Found " << summary.total_issues << " issue(s):";
  if (const auto critical = count_of("critical"); critical > 0) {
    text << " " << critical << " critical";
  }
  if (const auto errors = count_of("error"); errors > 0) {
    text << " " << errors << " error(s)";
  }
  if (const auto warnings = count_of("warning"); warnings > 0) {
    text << " " << warnings << " warning(s)";
  }
  if (const auto info = count_of("info"); info > 0) {
    text << " " << info << " info";
  }
  if (const auto unknown = count_of("unknown"); unknown > 0) {
    text << " " << unknown << " unclassified";
  }
  text << "\nCategories:";
  for (const auto &[category, count] : summary.by_category) {
    text << "\n  - " << Capitalize(category) << ": " << count;
  }
  return text.str();
}

ReviewReport Aggregate(const std::vector<Comment> &comments,
                       const std::shared_ptr<Logger> &logger) {
  ReviewReport report;
  report.comments = Deduplicate(comments);
  Rank(report.comments);
  report.total_issues = report.comments.size();
  report.summary = Summarize(report.comments);

  if (logger) {
    logger->Log(LogLevel::kInfo, "aggregate.complete",
                {{"received", std::to_string(comments.size())},
                 {"unique", std::to_string(report.total_issues)}});
  }
  return report;
}

} // namespace review
