// =============================================================================
// wfgen - Job Types
// =============================================================================
// Names of the background jobs this worker understands, as they appear on
// the external job queue.
// =============================================================================

#ifndef WFG_JOB_JOB_REGISTRY_H
#define WFG_JOB_JOB_REGISTRY_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace wfg::job {

/// @brief Background job kinds.
enum class JobType : std::uint8_t {
    kGenerateWaveform = 0,  ///< Render and publish the waveform of one post
};

/// @brief Queue name of a job type.
[[nodiscard]] std::string_view jobTypeName(JobType type) noexcept;

/// @brief Parse a queue name.
/// @return The job type, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<JobType> jobTypeFromString(std::string_view name) noexcept;

/// @brief Check whether a queue name denotes a known job type.
[[nodiscard]] bool isValidJobType(std::string_view name) noexcept;

}  // namespace wfg::job

#endif  // WFG_JOB_JOB_REGISTRY_H
