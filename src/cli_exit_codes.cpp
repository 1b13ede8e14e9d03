#include <modlint/cli_exit_codes.h>

namespace modlint {

int ReviewExitCode(const ReviewOutcome &outcome) {
  if (outcome.IsClean()) {
    return 0;
  }
  return 2;
}

} // namespace modlint
