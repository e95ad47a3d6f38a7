// =============================================================================
// wfgen - Waveform Image Generator
// =============================================================================
// Main entry point for the wfg command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: generate, render, info, verify
// - Global options: verbose, quiet, log-file
// - Storage settings from WFG_* environment variables, overridable per run
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "wfg/common/config.h"
#include "wfg/common/error.h"
#include "wfg/common/logger.h"
#include "wfg/common/types.h"

#include "commands/generate_command.h"
#include "commands/info_command.h"
#include "commands/render_command.h"
#include "commands/verify_command.h"

namespace wfg::commands {
int runGenerate(CLI::App* app);
int runRender(CLI::App* app);
int runInfo(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace wfg::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "wfg: waveform image generator\n"
    "Renders the amplitude envelope of an audio file as a PNG bar chart.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
    bool logTruncate = false;
    std::size_t logRotateMiB = 0;
    std::uint32_t logBackups = 5;
};

GlobalOptions gOptions;

// =============================================================================
// Waveform Options (shared by generate and render)
// =============================================================================

struct CliWaveformOptions {
    std::uint32_t width = wfg::kDefaultWaveformWidth;
    std::uint32_t height = wfg::kDefaultWaveformHeight;
    std::size_t samples = wfg::kDefaultWaveformSamples;
    std::string decoder;
    std::string tempDir;
};

// =============================================================================
// Generate Command Options
// =============================================================================

struct CliGenerateOptions {
    wfg::SubjectId subjectId = 0;
    std::string assetKey;
    std::string storageRoot;
    std::string publicUrl;
    std::string subjectRoot;
    CliWaveformOptions waveform;
};

CliGenerateOptions gGenerateOpts;

// =============================================================================
// Render Command Options
// =============================================================================

struct CliRenderOptions {
    std::string input;
    std::string output;
    CliWaveformOptions waveform;
};

CliRenderOptions gRenderOpts;

// =============================================================================
// Info / Verify Command Options
// =============================================================================

struct CliInfoOptions {
    std::string input;
    bool json = false;
};

CliInfoOptions gInfoOpts;

struct CliVerifyOptions {
    std::string input;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void addWaveformOptions(CLI::App* cmd, CliWaveformOptions& opts) {
    cmd->add_option("--width", opts.width, "Image width in pixels")
        ->default_val(wfg::kDefaultWaveformWidth)
        ->check(CLI::Range(std::uint32_t{1}, wfg::kMaxImageDimension));

    cmd->add_option("--height", opts.height, "Image height in pixels")
        ->default_val(wfg::kDefaultWaveformHeight)
        ->check(CLI::Range(std::uint32_t{1}, wfg::kMaxImageDimension));

    cmd->add_option("--samples", opts.samples, "Number of amplitude bars")
        ->default_val(wfg::kDefaultWaveformSamples)
        ->check(CLI::PositiveNumber);

    cmd->add_option("--decoder", opts.decoder,
                    "Decoder executable (default: $WFG_DECODER or ffmpeg)");

    cmd->add_option("--temp-dir", opts.tempDir, "Directory for temporary files");
}

void setupGenerateCommand(CLI::App& app) {
    auto* generate = app.add_subcommand("generate", "Run a waveform job for one subject");
    generate->alias("g");

    generate->add_option("--subject-id", gGenerateOpts.subjectId, "Owning record ID")
        ->required()
        ->check(CLI::PositiveNumber);

    generate->add_option("--asset-key", gGenerateOpts.assetKey, "Object key of the source audio")
        ->required();

    generate->add_option("--storage-root", gGenerateOpts.storageRoot,
                         "Object store directory (default: $WFG_STORAGE_ROOT)");

    generate->add_option("--public-url", gGenerateOpts.publicUrl,
                         "Public base URL of stored objects (default: $WFG_PUBLIC_URL)");

    generate->add_option("--subject-root", gGenerateOpts.subjectRoot,
                         "Subject record directory (default: $WFG_SUBJECT_ROOT)");

    addWaveformOptions(generate, gGenerateOpts.waveform);
}

void setupRenderCommand(CLI::App& app) {
    auto* render = app.add_subcommand("render", "Render a local audio file to PNG");
    render->alias("r");

    render->add_option("-i,--input", gRenderOpts.input, "Input audio file")
        ->required()
        ->check(CLI::ExistingFile);

    render->add_option("-o,--output", gRenderOpts.output, "Output PNG file")->required();

    addWaveformOptions(render, gRenderOpts.waveform);
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display PNG structure");
    info->alias("i");

    info->add_option("-i,--input", gInfoOpts.input, "Input PNG file")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Verify PNG integrity");
    verify->alias("v");

    verify->add_option("-i,--input", gVerifyOpts.input, "Input PNG file")
        ->required()
        ->check(CLI::ExistingFile);

    verify->add_flag("--verbose", gVerifyOpts.verbose, "Show every check");
}

wfg::WaveformConfig toWaveformConfig(const CliWaveformOptions& opts) {
    wfg::WaveformConfig config;
    config.width = opts.width;
    config.height = opts.height;
    config.sampleCount = opts.samples;
    config.decoderPath = opts.decoder.empty() ? wfg::decoderFromEnvironment() : opts.decoder;
    config.tempDirectory = opts.tempDir;
    return config;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");

    app.add_option("--log-file", gOptions.logFile,
                   "Also write log messages to this file (appended across runs)");

    app.add_flag("--log-truncate", gOptions.logTruncate, "Start the log file empty")
        ->needs("--log-file");

    app.add_option("--log-rotate-mb", gOptions.logRotateMiB,
                   "Rotate the log file once it reaches this many MiB")
        ->needs("--log-file")
        ->check(CLI::PositiveNumber);

    app.add_option("--log-backups", gOptions.logBackups, "Rotated log files to keep")
        ->default_val(5)
        ->check(CLI::Range(1, 100));

    setupGenerateCommand(app);
    setupRenderCommand(app);
    setupInfoCommand(app);
    setupVerifyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        wfg::log::Config logConfig;
        logConfig.level = wfg::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
        logConfig.logFile = gOptions.logFile;
        logConfig.fileMode =
            gOptions.logTruncate ? wfg::log::FileMode::kTruncate : wfg::log::FileMode::kAppend;
        logConfig.rotateBytes = gOptions.logRotateMiB * 1024 * 1024;
        logConfig.maxBackups = gOptions.logBackups;
        wfg::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("generate")) {
            exitCode = wfg::commands::runGenerate(app.get_subcommand("generate"));
        } else if (app.got_subcommand("render")) {
            exitCode = wfg::commands::runRender(app.get_subcommand("render"));
        } else if (app.got_subcommand("info")) {
            exitCode = wfg::commands::runInfo(app.get_subcommand("info"));
        } else if (app.got_subcommand("verify")) {
            exitCode = wfg::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const wfg::WfgException& ex) {
        WFG_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        WFG_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    wfg::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace wfg::commands {

int runGenerate([[maybe_unused]] CLI::App* app) {
    GenerateOptions opts;
    opts.subjectId = gGenerateOpts.subjectId;
    opts.assetKey = gGenerateOpts.assetKey;
    opts.waveform = toWaveformConfig(gGenerateOpts.waveform);

    // Command line overrides environment, field by field.
    opts.storage = StorageConfig::fromEnvironment();
    if (!gGenerateOpts.storageRoot.empty()) {
        opts.storage.storageRoot = gGenerateOpts.storageRoot;
    }
    if (!gGenerateOpts.publicUrl.empty()) {
        opts.storage.publicBaseUrl = gGenerateOpts.publicUrl;
    }
    if (!gGenerateOpts.subjectRoot.empty()) {
        opts.storage.subjectRoot = gGenerateOpts.subjectRoot;
    }

    GenerateCommand cmd(std::move(opts));
    return cmd.execute();
}

int runRender([[maybe_unused]] CLI::App* app) {
    RenderOptions opts;
    opts.inputPath = gRenderOpts.input;
    opts.outputPath = gRenderOpts.output;
    opts.waveform = toWaveformConfig(gRenderOpts.waveform);

    RenderCommand cmd(std::move(opts));
    return cmd.execute();
}

int runInfo([[maybe_unused]] CLI::App* app) {
    auto cmd = createInfoCommand(gInfoOpts.input, gInfoOpts.json);
    return cmd->execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    auto cmd = createVerifyCommand(gVerifyOpts.input, gVerifyOpts.verbose);
    return cmd->execute();
}

}  // namespace wfg::commands
