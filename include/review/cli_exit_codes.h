#pragma once

#include <review/models.h>

namespace review {

inline constexpr int kExitClean = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitBlockingFindings = 2;

// 0 for a successful run without error or critical comments, 2 when at least
// one such comment exists, 1 for a failed run.
int ReviewExitCode(const ReviewReport &report);

} // namespace review
