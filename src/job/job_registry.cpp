// =============================================================================
// wfgen - Job Types Implementation
// =============================================================================

#include "wfg/job/job_registry.h"

namespace wfg::job {

std::string_view jobTypeName(JobType type) noexcept {
    switch (type) {
        case JobType::kGenerateWaveform:
            return "generateWaveform";
    }
    return "unknown";
}

std::optional<JobType> jobTypeFromString(std::string_view name) noexcept {
    if (name == jobTypeName(JobType::kGenerateWaveform)) {
        return JobType::kGenerateWaveform;
    }
    return std::nullopt;
}

bool isValidJobType(std::string_view name) noexcept {
    return jobTypeFromString(name).has_value();
}

}  // namespace wfg::job
