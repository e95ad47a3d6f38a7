// =============================================================================
// wfgen - Generate / Render Command Tests
// =============================================================================
// The decoder is pointed at a program that always fails, so both commands
// exercise the placeholder-amplitude path without needing ffmpeg installed.
// =============================================================================

#include "commands/generate_command.h"
#include "commands/render_command.h"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>

#include "wfg/common/error.h"
#include "wfg/format/png_reader.h"
#include "wfg/storage/subject_store.h"

namespace wfg::commands::test {

class CommandWorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = std::filesystem::temp_directory_path() /
               ("wfg_gen_test_" + std::to_string(counter++) + "_" +
                std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_ / "objects" / "uploads");
        std::ofstream(dir_ / "objects" / "uploads" / "9.m4a") << "not really audio";

        waveform_.decoderPath = "false";
        waveform_.tempDirectory = dir_;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] StorageConfig storage() const {
        StorageConfig cfg;
        cfg.storageRoot = dir_ / "objects";
        cfg.publicBaseUrl = "https://cdn.example.com/";
        cfg.subjectRoot = dir_ / "subjects";
        return cfg;
    }

    std::filesystem::path dir_;
    WaveformConfig waveform_;
};

// =============================================================================
// Generate
// =============================================================================

TEST_F(CommandWorkspaceTest, GeneratePublishesAndPersists) {
    GenerateCommand cmd({9, "uploads/9.m4a", storage(), waveform_});
    EXPECT_EQ(cmd.execute(), 0);

    const auto image = dir_ / "objects" / "waveforms" / "9.png";
    ASSERT_TRUE(std::filesystem::exists(image));
    auto reader = format::PngReader::fromFile(image);
    reader.open();
    EXPECT_EQ(reader.header().width, kDefaultWaveformWidth);

    storage::FileSubjectStore subjects(dir_ / "subjects");
    EXPECT_EQ(subjects.waveformUrl(9), "https://cdn.example.com/waveforms/9.png");
}

TEST_F(CommandWorkspaceTest, GenerateWithoutStorageIsNotConfigured) {
    StorageConfig empty;
    GenerateCommand cmd({9, "uploads/9.m4a", empty, waveform_});
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kNotConfigured));
}

TEST_F(CommandWorkspaceTest, GenerateMissingAssetIsIoError) {
    GenerateCommand cmd({9, "uploads/absent.m4a", storage(), waveform_});
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kIOError));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "objects" / "waveforms" / "9.png"));
}

TEST_F(CommandWorkspaceTest, GenerateRejectsMissingSubject) {
    GenerateCommand cmd({0, "uploads/9.m4a", storage(), waveform_});
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kInvalidArgument));
}

// =============================================================================
// Render
// =============================================================================

TEST_F(CommandWorkspaceTest, RenderWritesPng) {
    waveform_.width = 64;
    waveform_.height = 16;
    waveform_.sampleCount = 32;
    const auto output = dir_ / "out.png";

    RenderCommand cmd({dir_ / "objects" / "uploads" / "9.m4a", output, waveform_});
    EXPECT_EQ(cmd.execute(), 0);

    auto reader = format::PngReader::fromFile(output);
    reader.open();
    EXPECT_EQ(reader.header().width, 64U);
    EXPECT_EQ(reader.header().height, 16U);
    EXPECT_EQ(reader.decode().alpha(0, 8), kOpaque);
}

TEST_F(CommandWorkspaceTest, RenderMissingInput) {
    RenderCommand cmd({dir_ / "nothing.mp3", dir_ / "out.png", waveform_});
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kIOError));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out.png"));
}

TEST_F(CommandWorkspaceTest, RenderRejectsInvalidGeometry) {
    waveform_.width = 0;
    RenderCommand cmd({dir_ / "objects" / "uploads" / "9.m4a", dir_ / "out.png", waveform_});
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kInvalidArgument));
}

}  // namespace wfg::commands::test
