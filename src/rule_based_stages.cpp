#include <review/rule_based_stages.h>

#include <review/language_classifier.h>

#include <algorithm>
#include <regex>
#include <utility>

namespace review {
namespace {

constexpr std::size_t kMaxLineLength = 120;

std::function<bool(const std::string &)>
Pattern(const std::string &expression, bool ignore_case = false) {
  auto flags = std::regex::ECMAScript;
  if (ignore_case) {
    flags |= std::regex::icase;
  }
  const std::regex pattern(expression, flags);
  return [pattern](const std::string &line) {
    return std::regex_search(line, pattern);
  };
}

LineRule Rule(std::function<bool(const std::string &)> matches,
              Severity severity, std::string message, std::string suggestion,
              std::vector<std::string> languages = {},
              ChangeKind applies_to = ChangeKind::kAddition) {
  LineRule rule;
  rule.applies_to = applies_to;
  rule.languages = std::move(languages);
  rule.matches = std::move(matches);
  rule.severity = severity;
  rule.message = std::move(message);
  rule.suggestion = std::move(suggestion);
  return rule;
}

bool AppliesToLanguage(const LineRule &rule, const std::string &language) {
  return rule.languages.empty() ||
         std::find(rule.languages.begin(), rule.languages.end(), language) !=
             rule.languages.end();
}

std::vector<LineRule> LogicRules() {
  std::vector<LineRule> rules;
  rules.push_back(Rule(Pattern(R"(^\s*except\s*:)"), Severity::kWarning,
                       "Bare except clause catches every exception, "
                       "including KeyboardInterrupt and SystemExit.",
                       "Catch only the exception types the block can handle.",
                       {"python"}));
  rules.push_back(Rule(Pattern(R"(catch\s*\([^)]*\)\s*\{\s*\})"),
                       Severity::kWarning,
                       "Empty catch block silently discards the error.",
                       "Handle, log or rethrow the exception.",
                       {"c", "cpp", "java", "javascript", "typescript",
                        "csharp", "kotlin", "php"}));
  rules.push_back(Rule(Pattern(R"([=!]=\s*None\b)"), Severity::kInfo,
                       "Comparison to None with == or !=.",
                       "Use 'is None' or 'is not None'.", {"python"}));
  rules.push_back(Rule(Pattern(R"([^=!<>]==[^=]|!=[^=])"), Severity::kInfo,
                       "Loose equality operator coerces operand types.",
                       "Use === or !== instead.",
                       {"javascript", "typescript"}));
  rules.push_back(Rule(Pattern(R"(^\s*while\s*\(?\s*(true|True|1)\s*\)?\s*[:{]?\s*$)"),
                       Severity::kInfo,
                       "Unbounded loop introduced.",
                       "Make sure the loop has a reachable exit condition."));
  rules.push_back(Rule(Pattern(R"(^\s*(assert|raise|throw)\b)"),
                       Severity::kWarning,
                       "Removed a validation or error-raising statement.",
                       "Confirm the check is still enforced elsewhere.", {},
                       ChangeKind::kDeletion));
  return rules;
}

std::vector<LineRule> SecurityRules() {
  std::vector<LineRule> rules;
  rules.push_back(Rule(
      Pattern(R"((password|passwd|secret|api[_-]?key|access[_-]?token|private[_-]?key)\w*["']?\s*[:=]\s*["'][^"']{4,}["'])",
              true),
      Severity::kCritical, "Possible hardcoded credential.",
      "Load secrets from the environment or a secret store."));
  rules.push_back(Rule(Pattern(R"(\beval\s*\()"), Severity::kError,
                       "eval() executes arbitrary code.",
                       "Parse the input explicitly instead of evaluating it.",
                       {"python", "javascript", "typescript", "php", "ruby"}));
  rules.push_back(Rule(Pattern(R"(shell\s*=\s*True)"), Severity::kError,
                       "Subprocess call with shell=True is open to command "
                       "injection.",
                       "Pass the command as an argument list without a shell.",
                       {"python"}));
  rules.push_back(Rule(Pattern(R"(\b(os\.system|system|popen)\s*\()"),
                       Severity::kWarning, "Shell command execution.",
                       "Validate or avoid user-controlled input in the "
                       "command.",
                       {"c", "cpp", "python", "php", "perl", "ruby"}));
  rules.push_back(Rule(Pattern(R"(\b(md5|sha1)\b)", true), Severity::kWarning,
                       "Weak hash algorithm.",
                       "Use SHA-256, or bcrypt/argon2 for passwords."));
  rules.push_back(Rule(Pattern(R"(verify\s*=\s*False)"), Severity::kError,
                       "TLS certificate verification disabled.",
                       "Keep verification enabled and configure a CA bundle.",
                       {"python"}));
  rules.push_back(Rule(
      Pattern(R"(\b(select|insert|update|delete)\b[^"']*["']\s*(\+|%|\.format\())",
              true),
      Severity::kError,
      "SQL statement built by string concatenation or formatting.",
      "Use parameterized queries."));
  rules.push_back(Rule(Pattern(R"(\b(strcpy|strcat|sprintf|gets)\s*\()"),
                       Severity::kError,
                       "Unbounded C string function can overflow its "
                       "destination buffer.",
                       "Use a bounded alternative such as snprintf or "
                       "std::string.",
                       {"c", "cpp"}));
  return rules;
}

std::vector<LineRule> PerformanceRules() {
  std::vector<LineRule> rules;
  rules.push_back(Rule(Pattern(R"(for\s+\w+\s+in\s+range\s*\(\s*len\s*\()"),
                       Severity::kInfo, "Indexing loop over range(len(...)).",
                       "Iterate directly or use enumerate().", {"python"}));
  rules.push_back(Rule(Pattern(R"(\bselect\s+\*)", true), Severity::kWarning,
                       "SELECT * fetches every column.",
                       "Select only the columns the caller needs."));
  rules.push_back(
      Rule(Pattern(R"(\b(time\.sleep|Thread\.sleep|sleep_for|usleep)\s*\()"),
           Severity::kWarning, "Blocking sleep in changed code.",
           "Prefer an event-driven wait or an asynchronous timer."));
  rules.push_back(Rule(Pattern(R"(std::endl)"), Severity::kInfo,
                       "std::endl flushes the stream on every line.",
                       "Write '\\n' and flush explicitly where required.",
                       {"cpp"}));
  rules.push_back(Rule(Pattern(R"(for\s*\(\s*auto\s+\w+\s*:)"), Severity::kInfo,
                       "Range-based for loop copies each element.",
                       "Use const auto & unless a copy is intended.",
                       {"cpp"}));
  rules.push_back(Rule(Pattern(R"(\.readlines\s*\(\s*\))"), Severity::kInfo,
                       "readlines() loads the whole file into memory.",
                       "Iterate over the file object instead.", {"python"}));
  return rules;
}

std::vector<LineRule> ReadabilityRules() {
  std::vector<LineRule> rules;
  auto long_line = Rule(
      [](const std::string &line) { return line.size() > kMaxLineLength; },
      Severity::kInfo,
      "Line exceeds " + std::to_string(kMaxLineLength) + " characters.",
      "Wrap the statement or extract a named variable.");
  long_line.max_line_length = 0;
  rules.push_back(std::move(long_line));
  rules.push_back(Rule(Pattern(R"([ \t]+$)"), Severity::kInfo,
                       "Trailing whitespace.",
                       "Strip trailing whitespace from the line."));
  rules.push_back(Rule(Pattern(R"(\b(TODO|FIXME|XXX)\b)"), Severity::kInfo,
                       "Unresolved TODO or FIXME marker.",
                       "Resolve it or link it to a tracked issue."));
  rules.push_back(Rule(Pattern(R"(^\s*(print\s*\(|console\.log\s*\())"),
                       Severity::kInfo, "Debug output left in changed code.",
                       "Remove it or route it through the logger.",
                       {"python", "javascript", "typescript"}));
  rules.push_back(Rule(Pattern(R"(^( +\t|\t+ ))"), Severity::kInfo,
                       "Indentation mixes tabs and spaces.",
                       "Indent consistently with one style."));
  return rules;
}

} // namespace

RuleBasedStage::RuleBasedStage(std::string name, std::string category,
                               std::vector<LineRule> rules)
    : name_(std::move(name)), category_(std::move(category)),
      rules_(std::move(rules)) {}

std::vector<Comment> RuleBasedStage::Analyze(const std::vector<FileDiff> &files,
                                             const StageContext &context) {
  std::vector<Comment> comments;
  for (const auto &file : files) {
    const auto &language =
        file.language != kUnknownLanguage ? file.language : context.language;
    for (const auto &hunk : file.hunks) {
      for (const auto &change : hunk.changes) {
        if (context.stop.stop_requested()) {
          return comments;
        }
        for (const auto &rule : rules_) {
          if (rule.applies_to != change.kind ||
              (rule.max_line_length != 0 &&
               change.content.size() > rule.max_line_length) ||
              !AppliesToLanguage(rule, language) ||
              !rule.matches(change.content)) {
            continue;
          }
          Comment comment;
          comment.file_path = file.Path();
          comment.line_number = change.line_number;
          comment.severity = rule.severity;
          comment.category = category_;
          comment.message = rule.message;
          comment.suggestion = rule.suggestion;
          comment.source_stage = name_;
          comments.push_back(std::move(comment));
        }
      }
    }
  }
  return comments;
}

std::unique_ptr<AnalysisStage> MakeLogicStage() {
  return std::make_unique<RuleBasedStage>(kLogicStage, "logic", LogicRules());
}

std::unique_ptr<AnalysisStage> MakeSecurityStage() {
  return std::make_unique<RuleBasedStage>(kSecurityStage, "security",
                                          SecurityRules());
}

std::unique_ptr<AnalysisStage> MakePerformanceStage() {
  return std::make_unique<RuleBasedStage>(kPerformanceStage, "performance",
                                          PerformanceRules());
}

std::unique_ptr<AnalysisStage> MakeReadabilityStage() {
  return std::make_unique<RuleBasedStage>(kReadabilityStage, "readability",
                                          ReadabilityRules());
}

} // namespace review
