#pragma once

#include <review/interfaces.h>

namespace review {

// Renders Markdown and/or JSON depending on the requested formats; Markdown is
// the default when no format is requested.
class MarkdownReporter : public Reporter {
public:
  Report Render(const ReviewReport &report,
                const std::vector<std::string> &formats) override;
};

} // namespace review
