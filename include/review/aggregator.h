#pragma once

#include <review/logging.h>
#include <review/models.h>

#include <memory>
#include <string>
#include <vector>

namespace review {

// Merges the comments of every stage into one report. Duplicates share a file
// path and a message that compares equal after trimming and case folding; the
// first occurrence is kept. Survivors are ordered by severity rank, file path
// and line number (absent lines count as 0).
ReviewReport Aggregate(const std::vector<Comment> &comments,
                       const std::shared_ptr<Logger> &logger = nullptr);

std::string NormalizeMessage(const std::string &message);
ReviewSummary Summarize(const std::vector<Comment> &comments);
std::string SummaryText(const ReviewSummary &summary);

} // namespace review
