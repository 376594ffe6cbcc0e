#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kit {

// ============================================================================
// Subprocess Execution
// ============================================================================

struct ProcessOptions {
    std::vector<std::string> argv;     // argv[0] is resolved against PATH
    long timeout_ms = 0;               // <= 0 waits forever
    size_t output_limit = 1 << 20;     // bytes of combined output kept (tail)
};

struct ProcessResult {
    bool spawned = false;   // false when fork/exec failed; see error
    int exit_code = -1;     // 128 + signal when killed by a signal
    bool timed_out = false;
    bool truncated = false;
    std::string output;     // stdout and stderr interleaved
    std::string error;
};

/**
 * Run a command without a shell, capturing stdout and stderr into one buffer.
 *
 * Exec failures (binary missing, not executable) are reported through
 * spawned == false rather than as an exit code, so callers can tell
 * "could not start" apart from "ran and failed". On timeout the child gets
 * SIGTERM, then SIGKILL after a short grace period.
 */
ProcessResult run_process(const ProcessOptions& options);

} // namespace kit
