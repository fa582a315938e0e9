#include <review/review_cli.h>

#include <review/cli_exit_codes.h>
#include <review/file_diff_source.h>
#include <review/markdown_reporter.h>
#include <review/review_pipeline_builder.h>
#include <review/stage_registry.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace {

using review::ReviewOptions;

void PrintReviewUsage() {
  std::cout
      << "Usage: diff-review review (--diff <file> | --source <ref>) "
         "[options]\n"
      << "Options:\n"
      << "  --diff <file>           Unified diff to review ('-' reads stdin)\n"
      << "  --source <ref>          Reference resolved by the diff source\n"
      << "                          (a diff file path, or '-' for stdin)\n"
      << "  --language <tag>        Language hint (default: detected from "
         "paths)\n"
      << "  --context <text>        Free-text context passed to every stage\n"
      << "  --config <file>         Optional YAML config file\n"
      << "  --format <list>         Comma-separated list of output formats\n"
      << "                          (supported: markdown,json)\n"
      << "  --out <path>            Directory for report outputs (default: .)\n"
      << "  --stages <list>         Comma-separated stage names to run\n"
      << "                          (default: every registered stage)\n"
      << "  --stage-timeout-ms <n>  Per-stage timeout in milliseconds\n"
      << "                          (default: 30000)\n"
      << "  --log-level <level>     Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose               Shortcut for --log-level info\n"
      << "  --debug                 Shortcut for --log-level debug\n"
      << "  --help                  Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      values.push_back(Trim(current));
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  values.push_back(Trim(current));
  values.erase(std::remove(values.begin(), values.end(), std::string{}),
               values.end());
  return values;
}

void AppendUnique(std::string value, std::vector<std::string> &target) {
  if (std::find(target.begin(), target.end(), value) == target.end()) {
    target.push_back(std::move(value));
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(format);
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    AppendUnique(std::move(format), target);
  }
}

void AppendStages(const std::string &raw_stages,
                  std::vector<std::string> &target) {
  for (auto stage : SplitList(raw_stages)) {
    AppendUnique(ToLower(stage), target);
  }
}

long long ParseTimeout(const std::string &raw_value) {
  const auto value = Trim(raw_value);
  long long timeout = 0;
  const auto *begin = value.data();
  const auto *end = value.data() + value.size();
  const auto [position, error] = std::from_chars(begin, end, timeout);
  if (value.empty() || error != std::errc{} || position != end ||
      timeout <= 0) {
    throw std::invalid_argument(
        "Stage timeout must be a positive number of milliseconds: " +
        raw_value);
  }
  return timeout;
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleInputOption(const std::vector<std::string> &arguments,
                       std::size_t &index, ReviewOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--diff") {
    options.diff_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--source") {
    options.source = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--language") {
    options.language = ToLower(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--context") {
    options.context = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, ReviewOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        review::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = review::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = review::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleStageOption(const std::vector<std::string> &arguments,
                       std::size_t &index, ReviewOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--stages") {
    std::vector<std::string> stages;
    AppendStages(RequireValue(arguments, index, argument), stages);
    options.stages = std::move(stages);
    return true;
  }
  if (argument == "--stage-timeout-ms") {
    options.stage_timeout_ms =
        ParseTimeout(RequireValue(arguments, index, argument));
    return true;
  }
  return false;
}

bool DispatchReviewOption(const std::vector<std::string> &arguments,
                          std::size_t &index, ReviewOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, argument), options.formats);
    return true;
  }
  return HandleInputOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options) ||
         HandleStageOption(arguments, index, options);
}

void ValidateReviewOptions(const ReviewOptions &options) {
  if (!options.diff_file && !options.source) {
    throw std::invalid_argument(
        "--diff or --source is required (or set in config file)");
  }
  if (options.diff_file && options.source) {
    throw std::invalid_argument("--diff and --source are mutually exclusive");
  }
}

std::string ReadAll(std::istream &stream) {
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

std::string ReadDiffFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open diff file: " + path.string());
  }
  return ReadAll(stream);
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &root,
                  const review::Report &report) {
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "review_report.md", report.markdown);
  WriteFileIfContent(root / "review_report.json", report.json);
}

} // namespace

namespace review {

ReviewOptions
ParseReviewArguments(const std::vector<std::string> &arguments) {
  ReviewOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchReviewOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

using ConfigValue = std::variant<std::string, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "diff",     "source", "language",  "context",          "formats",
      "out",      "stages", "log_level", "stage_timeout_ms"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"timeout_ms", "stage_timeout_ms"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "stages") {
    return ExtractList(node, key, AppendStages);
  }
  return ExtractStringScalar(node, key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, ReviewOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "stages") {
      options.stages = std::get<std::vector<std::string>>(value);
      continue;
    }

    const auto &text = std::get<std::string>(value);
    if (key == "diff") {
      options.diff_file = text;
    } else if (key == "source") {
      options.source = text;
    } else if (key == "language") {
      options.language = ToLower(Trim(text));
    } else if (key == "context") {
      options.context = text;
    } else if (key == "out") {
      options.output_directory = text;
    } else if (key == "log_level") {
      options.log_level = ParseLogLevel(text);
    } else if (key == "stage_timeout_ms") {
      options.stage_timeout_ms = ParseTimeout(text);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

ReviewOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  ReviewOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

ReviewOptions MergeOptions(const ReviewOptions &config_options,
                           const ReviewOptions &cli_options) {
  ReviewOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  // An input given on the command line replaces either input from the file.
  if (cli_options.diff_file || cli_options.source) {
    merged.diff_file = cli_options.diff_file;
    merged.source = cli_options.source;
  }
  override_value(merged.language, cli_options.language);
  override_value(merged.context, cli_options.context);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.stages, cli_options.stages);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.stage_timeout_ms, cli_options.stage_timeout_ms);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  return merged;
}

ReviewOptions ResolveReviewOptions(const ReviewOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  ReviewOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateReviewOptions(merged);
  return merged;
}

ReviewRequest BuildReviewRequest(const ReviewOptions &options,
                                 std::istream &standard_input) {
  ReviewRequest request;
  if (options.source) {
    request.reference = *options.source;
  } else if (options.diff_file) {
    request.diff = options.diff_file->string() == kStandardInputReference
                       ? ReadAll(standard_input)
                       : ReadDiffFile(*options.diff_file);
  }
  request.language = options.language;
  request.context = options.context;
  return request;
}

LoggingConfig BuildLoggingConfig(const ReviewOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

DefaultReviewPipeline BuildReviewPipeline(const ReviewOptions &options,
                                          const std::shared_ptr<Logger> &logger) {
  ReviewPipelineBuilder builder;
  builder.WithLogger(logger);
  builder.WithDiffSource(std::make_unique<FileDiffSource>(std::cin, logger));
  if (options.stages) {
    builder.WithStageNames(*options.stages);
  }
  if (options.stage_timeout_ms) {
    builder.WithStageTimeout(
        std::chrono::milliseconds(*options.stage_timeout_ms));
  }
  return builder.Build();
}

void LogDiagnostics(const std::vector<StageDiagnostic> &diagnostics,
                    Logger &logger) {
  for (const auto &diagnostic : diagnostics) {
    logger.Log(LogLevel::kInfo, "review.stage",
               {{"stage", diagnostic.stage},
                {"status", StageStatusName(diagnostic.status)},
                {"comments", std::to_string(diagnostic.comment_count)},
                {"duration_ms", std::to_string(diagnostic.duration_ms)},
                {"message", diagnostic.message}});
  }
}

int RunReview(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseReviewArguments(arguments);
  if (cli_options.show_help) {
    PrintReviewUsage();
    return kExitClean;
  }

  const auto options = ResolveReviewOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(options), std::clog);
  auto pipeline = BuildReviewPipeline(options, logger);
  const auto request = BuildReviewRequest(options, std::cin);

  const auto result = pipeline.Run(request);
  LogDiagnostics(result.diagnostics, *logger);

  MarkdownReporter reporter;
  const auto formats = options.formats.empty()
                           ? std::vector<std::string>{"markdown"}
                           : options.formats;
  WriteReports(options.output_directory.value_or(std::filesystem::path(".")),
               reporter.Render(result.report, formats));

  std::cout << result.report.summary.text << "\n";
  return ReviewExitCode(result.report);
}

int RunStagesCommand(const std::vector<std::string> &arguments) {
  if (!arguments.empty()) {
    throw std::invalid_argument("Unknown stages argument: " +
                                arguments.front());
  }
  for (const auto &name : GlobalStageRegistry().StageNames()) {
    std::cout << name << "\n";
  }
  return kExitClean;
}

} // namespace review
