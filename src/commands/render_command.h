// =============================================================================
// wfgen - Render Command
// =============================================================================
// Renders a local audio file straight to a local PNG, without any store.
// =============================================================================

#ifndef WFG_COMMANDS_RENDER_COMMAND_H
#define WFG_COMMANDS_RENDER_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <span>

#include "wfg/common/config.h"

namespace wfg::commands {

/// @brief Options for the render command.
struct RenderOptions {
    /// @brief Input audio file.
    std::filesystem::path inputPath;

    /// @brief Output PNG file.
    std::filesystem::path outputPath;

    /// @brief Rendering settings.
    WaveformConfig waveform;
};

/// @brief Command handler for local rendering.
class RenderCommand {
public:
    explicit RenderCommand(RenderOptions options);

    /// @brief Execute the render.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const RenderOptions& options() const noexcept { return options_; }

private:
    void writeOutput(std::span<const std::uint8_t> image) const;

    RenderOptions options_;
};

}  // namespace wfg::commands

#endif  // WFG_COMMANDS_RENDER_COMMAND_H
