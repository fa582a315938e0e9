#include <review/language_classifier.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>
#include <utility>

namespace review {
namespace {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

const std::unordered_map<std::string, std::string> &ExtensionTable() {
  static const std::unordered_map<std::string, std::string> table = {
      {".py", "python"},        {".pyw", "python"},
      {".pyi", "python"},       {".js", "javascript"},
      {".jsx", "javascript"},   {".mjs", "javascript"},
      {".cjs", "javascript"},   {".ts", "typescript"},
      {".tsx", "typescript"},   {".html", "html"},
      {".htm", "html"},         {".css", "css"},
      {".scss", "scss"},        {".sass", "sass"},
      {".less", "less"},        {".java", "java"},
      {".kt", "kotlin"},        {".kts", "kotlin"},
      {".scala", "scala"},      {".groovy", "groovy"},
      {".c", "c"},              {".h", "c"},
      {".cpp", "cpp"},          {".cc", "cpp"},
      {".cxx", "cpp"},          {".hpp", "cpp"},
      {".hh", "cpp"},           {".hxx", "cpp"},
      {".cs", "csharp"},        {".go", "go"},
      {".rs", "rust"},          {".rb", "ruby"},
      {".rake", "ruby"},        {".php", "php"},
      {".phtml", "php"},        {".swift", "swift"},
      {".m", "objective-c"},    {".mm", "objective-c"},
      {".sh", "shell"},         {".bash", "bash"},
      {".zsh", "zsh"},          {".r", "r"},
      {".dart", "dart"},        {".ex", "elixir"},
      {".exs", "elixir"},       {".hs", "haskell"},
      {".lua", "lua"},          {".pl", "perl"},
      {".pm", "perl"},          {".sql", "sql"},
      {".yaml", "yaml"},        {".yml", "yaml"},
      {".json", "json"},        {".toml", "toml"},
      {".md", "markdown"},      {".markdown", "markdown"},
      {".xml", "xml"},          {".ini", "ini"},
      {".conf", "conf"},        {".config", "config"},
      {".vim", "vim"},          {".dockerfile", "dockerfile"}};
  return table;
}

const std::unordered_map<std::string, std::string> &FileNameTable() {
  static const std::unordered_map<std::string, std::string> table = {
      {"dockerfile", "dockerfile"},
      {"makefile", "makefile"},
      {"rakefile", "ruby"},
      {"gemfile", "ruby"},
      {"vagrantfile", "ruby"}};
  return table;
}

} // namespace

std::string LanguageClassifier::Classify(const std::string &path) const {
  if (path.empty()) {
    return kUnknownLanguage;
  }

  const std::filesystem::path file_path(path);
  const auto file_name = ToLower(file_path.filename().string());
  if (const auto found = FileNameTable().find(file_name);
      found != FileNameTable().end()) {
    return found->second;
  }

  const auto extension = ToLower(file_path.extension().string());
  if (const auto found = ExtensionTable().find(extension);
      found != ExtensionTable().end()) {
    return found->second;
  }
  return kUnknownLanguage;
}

std::string
LanguageClassifier::ClassifyPrimary(const std::vector<std::string> &paths) const {
  // Insertion order doubles as the tie breaker.
  std::vector<std::pair<std::string, int>> counts;
  for (const auto &path : paths) {
    const auto language = Classify(path);
    if (language == kUnknownLanguage) {
      continue;
    }
    const auto entry = std::find_if(
        counts.begin(), counts.end(),
        [&](const auto &item) { return item.first == language; });
    if (entry == counts.end()) {
      counts.emplace_back(language, 1);
    } else {
      ++entry->second;
    }
  }

  std::string best = kUnknownLanguage;
  int best_count = 0;
  for (const auto &[language, count] : counts) {
    if (count > best_count) {
      best = language;
      best_count = count;
    }
  }
  return best;
}

} // namespace review
