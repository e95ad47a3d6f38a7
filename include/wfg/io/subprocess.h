// =============================================================================
// wfgen - Subprocess Execution
// =============================================================================
// Blocking launch of an external program with captured stdout and stderr.
//
// The child is started with posix_spawnp (PATH lookup), stdin is connected
// to /dev/null, and both output pipes are drained concurrently with poll()
// so a chatty stderr can never stall a large stdout.
//
// Usage:
//   auto result = wfg::io::runProcess({"ffmpeg", "-i", path, "-f", "s16le", "-"});
//   if (result.succeeded()) { use(result.stdoutData); }
// =============================================================================

#ifndef WFG_IO_SUBPROCESS_H
#define WFG_IO_SUBPROCESS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wfg::io {

/// @brief Maximum number of stderr bytes retained for diagnostics.
inline constexpr std::size_t kMaxCapturedStderr = 64 * 1024;

/// @brief Outcome of a finished process.
struct ProcessResult {
    /// @brief Exit status when the process exited normally, -1 otherwise.
    int exitCode = -1;

    /// @brief Terminating signal number, 0 if the process exited normally.
    int termSignal = 0;

    /// @brief Everything the process wrote to stdout.
    std::vector<std::uint8_t> stdoutData;

    /// @brief Tail of what the process wrote to stderr (at most kMaxCapturedStderr).
    std::string stderrText;

    /// @brief Check for a normal exit with status 0.
    [[nodiscard]] bool succeeded() const noexcept { return termSignal == 0 && exitCode == 0; }
};

/// @brief Run a program to completion.
/// @param argv Program name (searched in PATH) followed by its arguments.
/// @return Exit status and captured output.
/// @throws UsageError if argv is empty.
/// @throws IOError if the program cannot be started or its output cannot be read.
[[nodiscard]] ProcessResult runProcess(const std::vector<std::string>& argv);

/// @brief Join argv into a single line for logging.
[[nodiscard]] std::string formatCommandLine(const std::vector<std::string>& argv);

}  // namespace wfg::io

#endif  // WFG_IO_SUBPROCESS_H
