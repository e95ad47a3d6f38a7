// =============================================================================
// wfgen - Subject Store Tests
// =============================================================================

#include "wfg/storage/subject_store.h"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>

namespace wfg::storage::test {

class FileSubjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path() /
                ("wfg_subject_test_" + std::to_string(counter++) + "_" +
                 std::to_string(std::random_device{}()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

TEST_F(FileSubjectStoreTest, WriteAndReadBack) {
    FileSubjectStore store(root_);
    EXPECT_FALSE(store.waveformUrl(42).has_value());

    auto result = store.updateWaveformUrl(42, "https://cdn.example.com/waveforms/42.png");
    ASSERT_TRUE(result.has_value()) << result.error().message();

    EXPECT_EQ(store.recordPath(42), root_ / "42.waveform_url");
    EXPECT_EQ(store.waveformUrl(42), "https://cdn.example.com/waveforms/42.png");
}

TEST_F(FileSubjectStoreTest, RecordHoldsOnlyTheUrl) {
    FileSubjectStore store(root_);
    ASSERT_TRUE(store.updateWaveformUrl(5, "https://x/5.png").has_value());

    std::ifstream in(store.recordPath(5));
    const std::string content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "https://x/5.png\n");
}

TEST_F(FileSubjectStoreTest, OverwriteReplacesUrl) {
    FileSubjectStore store(root_);
    ASSERT_TRUE(store.updateWaveformUrl(7, "https://old/7.png").has_value());
    ASSERT_TRUE(store.updateWaveformUrl(7, "https://new/7.png").has_value());
    EXPECT_EQ(store.waveformUrl(7), "https://new/7.png");
}

TEST_F(FileSubjectStoreTest, SubjectsAreIndependent) {
    FileSubjectStore store(root_);
    ASSERT_TRUE(store.updateWaveformUrl(1, "https://x/1.png").has_value());
    ASSERT_TRUE(store.updateWaveformUrl(2, "https://x/2.png").has_value());
    EXPECT_EQ(store.waveformUrl(1), "https://x/1.png");
    EXPECT_EQ(store.waveformUrl(2), "https://x/2.png");
}

TEST_F(FileSubjectStoreTest, InvalidIdIsRejected) {
    FileSubjectStore store(root_);
    auto zero = store.updateWaveformUrl(0, "https://x/0.png");
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code(), ErrorCode::kInvalidArgument);

    auto negative = store.updateWaveformUrl(-3, "https://x/n.png");
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_FALSE(std::filesystem::exists(root_));
}

TEST_F(FileSubjectStoreTest, UnwritableRootIsPersistenceError) {
    {
        std::ofstream blocker(root_);
    }
    FileSubjectStore store(root_);
    auto result = store.updateWaveformUrl(9, "https://x/9.png");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kPersistenceError);
    std::filesystem::remove(root_);
}

}  // namespace wfg::storage::test
