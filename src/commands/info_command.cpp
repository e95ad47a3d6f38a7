// =============================================================================
// wfgen - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <iostream>

#include <fmt/format.h>

#include "wfg/common/error.h"
#include "wfg/common/logger.h"
#include "wfg/format/png_reader.h"

namespace wfg::commands {

std::string jsonEscape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned>(ch));
                } else {
                    escaped += ch;
                }
        }
    }
    return escaped;
}

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : InfoCommand(std::move(options), std::cout) {}

InfoCommand::InfoCommand(InfoOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

int InfoCommand::execute() {
    try {
        if (!std::filesystem::exists(options_.inputPath)) {
            throw IOError("Input file not found: " + options_.inputPath.string());
        }

        auto reader = format::PngReader::fromFile(options_.inputPath);
        // Report-only: corrupt chunks are listed rather than rejected.
        reader.open(false);

        if (options_.jsonOutput) {
            printJsonInfo(reader);
        } else {
            printTextInfo(reader);
        }

        return toExitCode(ErrorCode::kSuccess);

    } catch (const WfgException& e) {
        WFG_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    }
}

void InfoCommand::printTextInfo(const format::PngReader& reader) {
    const auto& hdr = reader.header();

    out_ << "=== PNG Image Information ===\n\n";
    out_ << fmt::format("File:           {}\n", options_.inputPath.string());
    out_ << fmt::format("Size:           {} bytes\n", reader.size());
    out_ << fmt::format("Dimensions:     {} x {}\n", hdr.width, hdr.height);
    out_ << fmt::format("Bit depth:      {}\n", hdr.bitDepth);
    out_ << fmt::format("Color type:     {}{}\n", hdr.colorType,
                        hdr.colorType == format::kColorTypeRgba ? " (RGBA)" : "");
    out_ << fmt::format("Interlace:      {}\n", hdr.interlaceMethod == 0 ? "none" : "Adam7");

    out_ << "\n--- Chunks ---\n";
    for (const auto& chunk : reader.chunks()) {
        out_ << fmt::format("{:<6}offset {:>8}  length {:>8}  crc {:08x}{}\n", chunk.type,
                            chunk.offset, chunk.length, chunk.storedCrc,
                            chunk.crcValid() ? "" : fmt::format("  MISMATCH (computed {:08x})",
                                                                chunk.computedCrc));
    }

    if (reader.corruptChunkCount() > 0) {
        out_ << fmt::format("\nWARNING: {} chunk(s) failed CRC verification\n",
                            reader.corruptChunkCount());
    }

    out_ << "\n=============================" << std::endl;
}

void InfoCommand::printJsonInfo(const format::PngReader& reader) {
    const auto& hdr = reader.header();

    out_ << "{\n";
    out_ << fmt::format("  \"file\": \"{}\",\n", jsonEscape(options_.inputPath.string()));
    out_ << fmt::format("  \"size\": {},\n", reader.size());
    out_ << fmt::format("  \"width\": {},\n", hdr.width);
    out_ << fmt::format("  \"height\": {},\n", hdr.height);
    out_ << fmt::format("  \"bit_depth\": {},\n", hdr.bitDepth);
    out_ << fmt::format("  \"color_type\": {},\n", hdr.colorType);
    out_ << fmt::format("  \"interlace\": {},\n", hdr.interlaceMethod);
    out_ << "  \"chunks\": [";

    const auto& chunks = reader.chunks();
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        out_ << (i == 0 ? "\n" : ",\n");
        out_ << fmt::format(
            "    {{\"type\": \"{}\", \"offset\": {}, \"length\": {}, \"crc\": \"{:08x}\", "
            "\"crc_valid\": {}}}",
            jsonEscape(c.type), c.offset, c.length, c.storedCrc, c.crcValid());
    }

    out_ << "\n  ]\n";
    out_ << "}" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath, bool jsonOutput) {
    InfoOptions opts;
    opts.inputPath = inputPath;
    opts.jsonOutput = jsonOutput;
    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace wfg::commands
