// =============================================================================
// wfgen - Render Command Implementation
// =============================================================================

#include "render_command.h"

#include <fstream>
#include <memory>

#include "wfg/audio/amplitude_extractor.h"
#include "wfg/common/error.h"
#include "wfg/common/logger.h"
#include "wfg/format/png_encoder.h"
#include "wfg/render/waveform_rasterizer.h"

namespace wfg::commands {

RenderCommand::RenderCommand(RenderOptions options) : options_(std::move(options)) {}

int RenderCommand::execute() {
    try {
        unwrapOrThrow(options_.waveform.validate());

        if (!std::filesystem::exists(options_.inputPath)) {
            throw IOError("Input file not found: " + options_.inputPath.string(),
                          ErrorContext(options_.inputPath.string()));
        }

        const auto& cfg = options_.waveform;
        audio::AmplitudeExtractor extractor(
            std::make_unique<audio::FfmpegPcmDecoder>(cfg.decoderPath, cfg.sampleRate));

        const auto samples = extractor.extract(options_.inputPath, cfg.sampleCount);
        const auto grid = render::rasterizeWaveform(samples, cfg.width, cfg.height, cfg.color);
        const auto image = format::PngEncoder().encode(grid);
        writeOutput(image);

        WFG_LOG_INFO("Rendered {} -> {} ({}x{}, {} bytes{})", options_.inputPath.string(),
                     options_.outputPath.string(), cfg.width, cfg.height, image.size(),
                     extractor.usedFallback() ? ", placeholder amplitudes" : "");
        return toExitCode(ErrorCode::kSuccess);

    } catch (const WfgException& e) {
        WFG_LOG_ERROR("Render failed: {}", e.what());
        return e.exitCode();
    }
}

void RenderCommand::writeOutput(std::span<const std::uint8_t> image) const {
    std::ofstream out(options_.outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("Failed to open output file: " + options_.outputPath.string(),
                      ErrorContext(options_.outputPath.string()));
    }
    out.write(reinterpret_cast<const char*>(image.data()),
              static_cast<std::streamsize>(image.size()));
    if (!out) {
        throw IOError("Failed to write output file: " + options_.outputPath.string(),
                      ErrorContext(options_.outputPath.string()));
    }
}

}  // namespace wfg::commands
