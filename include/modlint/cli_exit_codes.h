#pragma once

#include <modlint/review_session.h>

namespace modlint {

// 0 when the review is clean, 2 when it reported diagnostics or the project
// could not be validated.
int ReviewExitCode(const ReviewOutcome &outcome);

} // namespace modlint
