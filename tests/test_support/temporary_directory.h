#ifndef REVIEW_TEST_SUPPORT_TEMPORARY_DIRECTORY_H
#define REVIEW_TEST_SUPPORT_TEMPORARY_DIRECTORY_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace review {
namespace test {

class TemporaryDirectory {
public:
  TemporaryDirectory() {
    static std::atomic<int> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("diff-review-" + std::to_string(timestamp) + "-" +
             std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryDirectory() {
    std::error_code error;
    std::filesystem::remove_all(root_, error);
  }

  TemporaryDirectory(const TemporaryDirectory &) = delete;
  TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path, std::ios::binary);
    stream << content;
    return full_path;
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

// Two files: a Python change with a hardcoded credential and a C++ change
// with only informational findings.
inline const char kSampleDiff[] =
    "diff --git a/app/settings.py b/app/settings.py\n"
    "index 3b18e51..a9c3f02 100644\n"
    "--- a/app/settings.py\n"
    "+++ b/app/settings.py\n"
    "@@ -1,3 +1,4 @@\n"
    " import os\n"
    "-DEBUG = False\n"
    "+DEBUG = True\n"
    "+api_key = \"sk-live-0123456789\"\n"
    " TIMEOUT = 30\n"
    "diff --git a/src/util.cpp b/src/util.cpp\n"
    "--- a/src/util.cpp\n"
    "+++ b/src/util.cpp\n"
    "@@ -10,2 +10,3 @@ int Sum() {\n"
    "   int total = 0;\n"
    "+  // TODO: handle overflow\n"
    "   return total;\n";

} // namespace test
} // namespace review

#endif // REVIEW_TEST_SUPPORT_TEMPORARY_DIRECTORY_H
