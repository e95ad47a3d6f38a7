// =============================================================================
// wfgen - Amplitude Extraction Implementation
// =============================================================================

#include "wfg/audio/amplitude_extractor.h"

#include <algorithm>
#include <cstdlib>
#include <exception>

#include <fmt/format.h>

#include "wfg/common/logger.h"
#include "wfg/io/subprocess.h"

namespace wfg::audio {

namespace {

/// @brief Longest stderr excerpt copied into an error message.
constexpr std::size_t kStderrExcerpt = 512;

std::string stderrTail(const std::string& text) {
    if (text.size() <= kStderrExcerpt) {
        return text;
    }
    return text.substr(text.size() - kStderrExcerpt);
}

void requirePositiveCount(std::size_t count) {
    if (count == 0) {
        throw UsageError("Amplitude sample count must be > 0");
    }
}

/// @brief Run a decoder, turning anything it throws into an error value.
Result<PcmSamples> decodeGuarded(IPcmDecoder& decoder, const std::filesystem::path& path) {
    try {
        return decoder.decode(path);
    } catch (const std::exception& e) {
        return makeError<PcmSamples>(ErrorCode::kIOError,
                                     fmt::format("decoder threw: {}", e.what()));
    }
}

}  // namespace

// =============================================================================
// FfmpegPcmDecoder Implementation
// =============================================================================

FfmpegPcmDecoder::FfmpegPcmDecoder(std::string decoderPath, std::uint32_t sampleRate)
    : decoderPath_(std::move(decoderPath)), sampleRate_(sampleRate) {}

std::vector<std::string> FfmpegPcmDecoder::commandLine(const std::filesystem::path& path) const {
    return {decoderPath_, "-i", path.string(), "-f", "s16le", "-ac", "1",
            "-ar", std::to_string(sampleRate_), "-"};
}

Result<PcmSamples> FfmpegPcmDecoder::decode(const std::filesystem::path& path) {
    io::ProcessResult process;
    try {
        process = io::runProcess(commandLine(path));
    } catch (const WfgException& ex) {
        return makeError<PcmSamples>(ex);
    }

    if (!process.succeeded()) {
        std::string status = process.termSignal != 0
                                 ? fmt::format("killed by signal {}", process.termSignal)
                                 : fmt::format("exit code {}", process.exitCode);
        return makeError<PcmSamples>(
            ErrorCode::kIOError,
            fmt::format("{} failed on {} ({}): {}", decoderPath_, path.string(), status,
                        stderrTail(process.stderrText)));
    }

    return pcmFromLittleEndian(process.stdoutData);
}

PcmSamples pcmFromLittleEndian(std::span<const std::uint8_t> bytes) {
    PcmSamples samples(bytes.size() / 2);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const auto lo = static_cast<std::uint16_t>(bytes[2 * i]);
        const auto hi = static_cast<std::uint16_t>(bytes[2 * i + 1]);
        samples[i] = static_cast<std::int16_t>(static_cast<std::uint16_t>(lo | (hi << 8)));
    }
    return samples;
}

// =============================================================================
// Amplitude Reduction
// =============================================================================

AmplitudeSeries computeAmplitudes(std::span<const std::int16_t> samples, std::size_t count) {
    requirePositiveCount(count);

    AmplitudeSeries peaks(count, 0.0F);
    if (samples.empty()) {
        return peaks;
    }

    const std::size_t bucketSize = samples.size() / count;
    float maxPeak = 0.0F;

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t begin = i * bucketSize;
        const std::size_t end = (i + 1 == count) ? samples.size() : begin + bucketSize;

        int peak = 0;
        for (std::size_t j = begin; j < end; ++j) {
            peak = std::max(peak, std::abs(static_cast<int>(samples[j])));
        }

        peaks[i] = static_cast<float>(peak) / kPcmFullScale;
        maxPeak = std::max(maxPeak, peaks[i]);
    }

    const float divisor = std::max(maxPeak, kNormalizationFloor);
    for (float& value : peaks) {
        value = std::clamp(value / divisor, 0.0F, 1.0F);
    }

    return peaks;
}

AmplitudeSeries fallbackAmplitudes(std::size_t count, std::mt19937& engine) {
    std::uniform_real_distribution<float> dist(kFallbackMinAmplitude, kFallbackMaxAmplitude);
    AmplitudeSeries values(count);
    for (float& value : values) {
        value = std::clamp(dist(engine), kFallbackMinAmplitude, kFallbackMaxAmplitude);
    }
    return values;
}

// =============================================================================
// AmplitudeExtractor Implementation
// =============================================================================

AmplitudeExtractor::AmplitudeExtractor(std::unique_ptr<IPcmDecoder> decoder)
    : AmplitudeExtractor(std::move(decoder), std::random_device{}()) {}

AmplitudeExtractor::AmplitudeExtractor(std::unique_ptr<IPcmDecoder> decoder, std::uint32_t seed)
    : decoder_(std::move(decoder)), engine_(seed) {
    if (!decoder_) {
        throw UsageError("AmplitudeExtractor requires a decoder");
    }
}

AmplitudeSeries AmplitudeExtractor::extract(const std::filesystem::path& path,
                                            std::size_t count) {
    requirePositiveCount(count);
    usedFallback_ = false;

    auto decoded = decodeGuarded(*decoder_, path);

    if (!decoded) {
        WFG_LOG_WARNING("Waveform extraction failed for {}, using fallback: {}", path.string(),
                        decoded.error().message());
    } else if (decoded->empty()) {
        WFG_LOG_WARNING("Decoder produced no samples for {}, using fallback", path.string());
    } else {
        WFG_LOG_DEBUG("Decoded {} samples from {} into {} buckets", decoded->size(),
                      path.string(), count);
        return computeAmplitudes(*decoded, count);
    }

    usedFallback_ = true;
    return fallbackAmplitudes(count, engine_);
}

}  // namespace wfg::audio
