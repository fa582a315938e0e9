#pragma once

#include <review/interfaces.h>
#include <review/logging.h>

#include <iosfwd>
#include <memory>
#include <string>

namespace review {

inline constexpr const char kStandardInputReference[] = "-";

// Resolves a reference as a path to a unified diff on disk, or as standard
// input when the reference is "-".
class FileDiffSource : public DiffSource {
public:
  explicit FileDiffSource(std::istream &standard_input,
                          std::shared_ptr<Logger> logger = nullptr);

  FetchedDiff Fetch(const std::string &reference) override;

private:
  std::istream *standard_input_;
  std::shared_ptr<Logger> logger_;
};

} // namespace review
