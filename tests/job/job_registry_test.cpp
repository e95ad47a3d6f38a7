// =============================================================================
// wfgen - Job Type Tests
// =============================================================================

#include "wfg/job/job_registry.h"

#include <gtest/gtest.h>

namespace wfg::job {
namespace {

TEST(JobRegistryTest, GenerateWaveformIsKnown) {
    EXPECT_TRUE(isValidJobType("generateWaveform"));
    EXPECT_EQ(jobTypeName(JobType::kGenerateWaveform), "generateWaveform");
    EXPECT_EQ(jobTypeFromString("generateWaveform"), JobType::kGenerateWaveform);
}

TEST(JobRegistryTest, UnknownNamesAreRejected) {
    EXPECT_FALSE(isValidJobType(""));
    EXPECT_FALSE(isValidJobType("GenerateWaveform"));
    EXPECT_FALSE(isValidJobType("generateWaveform "));
    EXPECT_FALSE(isValidJobType("sendEmail"));
    EXPECT_FALSE(jobTypeFromString("sendEmail").has_value());
}

}  // namespace
}  // namespace wfg::job
