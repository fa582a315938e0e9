#include <review/markdown_reporter.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <unordered_map>

namespace review {
namespace {

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      std::ostringstream code;
      code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(character);
      escaped.append(code.str());
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n') {
      escaped.append("<br>");
    } else if (character != '\r') {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string JsonString(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string StatusName(ReviewStatus status) {
  return status == ReviewStatus::kSuccess ? "success" : "error";
}

std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
#ifdef _WIN32
  gmtime_s(&tm, &now_time);
#else
  gmtime_r(&now_time, &tm);
#endif
  std::ostringstream stream;
  stream << std::put_time(&tm, "%FT%TZ");
  return stream.str();
}

std::string BuildHeaderMarkdown(const ReviewReport &report,
                                const std::string &timestamp) {
  std::ostringstream section;
  section << "## Review Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Status | " << StatusName(report.status) << " |\n";
  section << "| Language | " << EscapeMarkdownCell(report.language) << " |\n";
  for (const auto &[key, value] : report.metadata) {
    section << "| " << EscapeMarkdownCell(key) << " | "
            << EscapeMarkdownCell(value) << " |\n";
  }
  if (report.status == ReviewStatus::kFailed) {
    section << "| Error | " << EscapeMarkdownCell(report.error) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildSummaryMarkdown(const ReviewReport &report) {
  std::ostringstream section;
  section << "## Summary\n\n";
  section << report.summary.text << "\n\n";
  return section.str();
}

std::string
BuildCountsMarkdown(const std::string &title, const std::string &column,
                    const std::map<std::string, std::size_t> &counts) {
  std::ostringstream section;
  section << "## " << title << "\n\n";
  section << "| " << column << " | Count |\n";
  section << "| --- | --- |\n";
  if (counts.empty()) {
    section << "| None | 0 |\n\n";
    return section.str();
  }
  for (const auto &[name, count] : counts) {
    section << "| " << EscapeMarkdownCell(name) << " | " << count << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildCommentsMarkdown(const ReviewReport &report) {
  std::ostringstream section;
  section << "## Comments\n\n";
  section << "| Severity | File | Line | Category | Message | Suggestion | "
             "Stage |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- |\n";
  if (report.comments.empty()) {
    section << "| None | - | - | - | - | - | - |\n";
    return section.str();
  }

  for (const auto &comment : report.comments) {
    const auto line =
        comment.line_number ? std::to_string(*comment.line_number) : "-";
    const auto suggestion =
        comment.suggestion ? EscapeMarkdownCell(*comment.suggestion) : "-";
    section << "| " << SeverityName(comment.severity) << " | "
            << EscapeMarkdownCell(comment.file_path) << " | " << line << " | "
            << EscapeMarkdownCell(comment.category) << " | "
            << EscapeMarkdownCell(comment.message) << " | " << suggestion
            << " | " << EscapeMarkdownCell(comment.source_stage) << " |\n";
  }
  return section.str();
}

std::string BuildCountsJson(const std::string &key,
                            const std::map<std::string, std::size_t> &counts) {
  std::ostringstream json;
  json << JsonString(key) << ": {";
  bool first = true;
  for (const auto &[name, count] : counts) {
    if (!first) {
      json << ",";
    }
    json << JsonString(name) << ": " << count;
    first = false;
  }
  json << "}";
  return json.str();
}

std::string BuildMetadataJson(const Metadata &metadata) {
  std::ostringstream json;
  json << "\"metadata\": {";
  for (std::size_t i = 0; i < metadata.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << JsonString(metadata[i].first) << ": "
         << JsonString(metadata[i].second);
  }
  json << "}";
  return json.str();
}

std::string BuildCommentsJson(const ReviewReport &report) {
  std::ostringstream json;
  json << "\"comments\": [";
  for (std::size_t i = 0; i < report.comments.size(); ++i) {
    const auto &comment = report.comments[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"file_path\": " << JsonString(comment.file_path) << ",";
    json << "\"line_number\": ";
    if (comment.line_number) {
      json << *comment.line_number;
    } else {
      json << "null";
    }
    json << ",";
    json << "\"severity\": " << JsonString(SeverityName(comment.severity))
         << ",";
    json << "\"category\": " << JsonString(comment.category) << ",";
    json << "\"message\": " << JsonString(comment.message) << ",";
    json << "\"suggestion\": "
         << (comment.suggestion ? JsonString(*comment.suggestion) : "null")
         << ",";
    json << "\"source_stage\": " << JsonString(comment.source_stage) << "}";
  }
  json << "]";
  return json.str();
}

} // namespace

Report MarkdownReporter::Render(const ReviewReport &report,
                                const std::vector<std::string> &formats) {
  const auto timestamp = Timestamp();

  Report rendered;
  if (ShouldRenderFormat(formats, "markdown")) {
    std::ostringstream output;
    output << "# Code Review Report\n\n";
    output << BuildHeaderMarkdown(report, timestamp);
    output << BuildSummaryMarkdown(report);
    output << BuildCountsMarkdown("Issues by Severity", "Severity",
                                  report.summary.by_severity);
    output << BuildCountsMarkdown("Issues by Category", "Category",
                                  report.summary.by_category);
    output << BuildCommentsMarkdown(report);
    rendered.markdown = output.str();
  }

  if (ShouldRenderFormat(formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << "\"generated_on\": " << JsonString(timestamp) << ",";
    output << "\"status\": " << JsonString(StatusName(report.status)) << ",";
    output << "\"error\": " << JsonString(report.error) << ",";
    output << "\"language\": " << JsonString(report.language) << ",";
    output << BuildMetadataJson(report.metadata) << ",";
    output << "\"total_issues\": " << report.total_issues << ",";
    output << "\"summary\": " << JsonString(report.summary.text) << ",";
    output << BuildCountsJson("by_severity", report.summary.by_severity)
           << ",";
    output << BuildCountsJson("by_category", report.summary.by_category)
           << ",";
    output << BuildCommentsJson(report);
    output << "}";
    rendered.json = output.str();
  }

  return rendered;
}

} // namespace review
