// =============================================================================
// wfgen - Generate Command
// =============================================================================
// Runs one WaveformJob against the directory-backed object and subject
// stores, exactly as the background worker would for a queued job.
// =============================================================================

#ifndef WFG_COMMANDS_GENERATE_COMMAND_H
#define WFG_COMMANDS_GENERATE_COMMAND_H

#include <string>

#include "wfg/common/config.h"
#include "wfg/common/types.h"

namespace wfg::commands {

/// @brief Options for the generate command.
struct GenerateOptions {
    /// @brief Record that owns the waveform.
    SubjectId subjectId = 0;

    /// @brief Object store key of the source audio.
    std::string assetKey;

    /// @brief Object and subject store locations.
    StorageConfig storage;

    /// @brief Rendering settings.
    WaveformConfig waveform;
};

/// @brief Command handler for waveform generation jobs.
class GenerateCommand {
public:
    explicit GenerateCommand(GenerateOptions options);

    /// @brief Execute the job.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const GenerateOptions& options() const noexcept { return options_; }

private:
    GenerateOptions options_;
};

}  // namespace wfg::commands

#endif  // WFG_COMMANDS_GENERATE_COMMAND_H
