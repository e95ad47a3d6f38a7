// =============================================================================
// wfgen - Verify Command
// =============================================================================
// Command handler for verifying PNG integrity.
//
// Checks, in order:
// - PNG signature
// - Chunk framing (IHDR first, IEND last, no trailing bytes)
// - CRC-32 of every chunk
// - IHDR describes the 8-bit RGBA non-interlaced layout
// - Image data inflates to exactly height * (1 + width * 4) bytes and
//   every scanline filter is valid
// =============================================================================

#ifndef WFG_COMMANDS_VERIFY_COMMAND_H
#define WFG_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace wfg::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    /// @brief Check name.
    std::string checkName;

    /// @brief Whether check passed.
    bool passed = false;

    /// @brief Error message (if failed).
    std::string errorMessage;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;

    /// @brief Number of failed checks that were CRC mismatches.
    std::uint32_t checksumFailures = 0;

    std::vector<VerificationResult> results;

    /// @brief Overall pass/fail.
    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    /// @brief Add a result.
    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for verify command.
struct VerifyOptions {
    /// @brief Input PNG file path.
    std::filesystem::path inputPath;

    /// @brief Print every check, not only failures.
    bool verbose = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying PNG integrity.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    VerifyCommand(VerifyOptions options, std::ostream& out);

    /// @brief Execute the verify command.
    /// @return 0 when every check passes, kChecksumError when only CRCs failed,
    ///         kFormatError for any structural failure.
    [[nodiscard]] int execute();

    /// @brief Get verification summary.
    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    void record(VerificationResult result);

    void printSummary() const;

    VerifyOptions options_;
    std::ostream& out_;
    VerificationSummary summary_;
};

/// @brief Create a verify command from CLI options.
[[nodiscard]] std::unique_ptr<VerifyCommand> createVerifyCommand(const std::string& inputPath,
                                                                 bool verbose);

}  // namespace wfg::commands

#endif  // WFG_COMMANDS_VERIFY_COMMAND_H
