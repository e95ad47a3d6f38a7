// =============================================================================
// wfgen - Info Command
// =============================================================================
// Command handler for displaying PNG structure.
//
// This module provides:
// - InfoCommand: image header and chunk listing
// - Support for JSON output format
// =============================================================================

#ifndef WFG_COMMANDS_INFO_COMMAND_H
#define WFG_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

namespace wfg::format {
class PngReader;
}  // namespace wfg::format

namespace wfg::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input PNG file path.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying PNG information.
class InfoCommand {
public:
    /// @brief Construct with options, writing to std::cout.
    explicit InfoCommand(InfoOptions options);

    /// @brief Construct with options and an output stream.
    InfoCommand(InfoOptions options, std::ostream& out);

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    /// @brief Print info in text format.
    void printTextInfo(const format::PngReader& reader);

    /// @brief Print info in JSON format.
    void printJsonInfo(const format::PngReader& reader);

    InfoOptions options_;
    std::ostream& out_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath,
                                                             bool jsonOutput);

/// @brief Escape a string for inclusion in a JSON document.
[[nodiscard]] std::string jsonEscape(const std::string& text);

}  // namespace wfg::commands

#endif  // WFG_COMMANDS_INFO_COMMAND_H
