// =============================================================================
// wfgen - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <iostream>
#include <optional>

#include <fmt/format.h>

#include "wfg/common/error.h"
#include "wfg/common/logger.h"
#include "wfg/format/png_reader.h"

namespace wfg::commands {

VerifyCommand::VerifyCommand(VerifyOptions options)
    : VerifyCommand(std::move(options), std::cout) {}

VerifyCommand::VerifyCommand(VerifyOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

void VerifyCommand::record(VerificationResult result) {
    if (options_.verbose || !result.passed) {
        out_ << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName;
        if (!result.passed) {
            out_ << ": " << result.errorMessage;
        }
        out_ << '\n';
    }
    summary_.addResult(std::move(result));
}

int VerifyCommand::execute() {
    summary_ = VerificationSummary{};

    std::optional<format::PngReader> reader;
    try {
        reader.emplace(format::PngReader::fromFile(options_.inputPath));
    } catch (const WfgException& e) {
        WFG_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    }

    if (options_.verbose) {
        out_ << "Verifying: " << options_.inputPath.string() << "\n\n";
    }

    // 1. Signature
    const bool signatureOk = format::hasPngSignature(reader->bytes());
    record({"PNG signature", signatureOk, signatureOk ? "" : "missing or corrupt"});

    // 2. Chunk structure (CRCs are checked separately below)
    bool structureOk = false;
    if (signatureOk) {
        try {
            reader->open(false);
            structureOk = true;
            record({"Chunk structure", true, ""});
        } catch (const WfgException& e) {
            record({"Chunk structure", false, e.message()});
        }
    }

    if (structureOk) {
        // 3. Chunk CRCs
        for (const auto& chunk : reader->chunks()) {
            VerificationResult result;
            result.checkName = fmt::format("{} CRC at offset {}", chunk.type, chunk.offset);
            result.passed = chunk.crcValid();
            if (!result.passed) {
                result.errorMessage = fmt::format("stored {:08x}, computed {:08x}",
                                                  chunk.storedCrc, chunk.computedCrc);
                ++summary_.checksumFailures;
            }
            record(std::move(result));
        }

        // 4. Header layout
        const auto& hdr = reader->header();
        record({"Image header", hdr.isRgba8(),
                hdr.isRgba8() ? ""
                              : fmt::format("unsupported layout (depth {}, color type {}, "
                                            "interlace {})",
                                            hdr.bitDepth, hdr.colorType, hdr.interlaceMethod)});

        // 5. Pixel data
        if (hdr.isRgba8()) {
            try {
                const auto grid = reader->decode();
                record({"Image data", true, ""});
                if (options_.verbose) {
                    out_ << fmt::format("Decoded {}x{} pixels\n", grid.width(), grid.height());
                }
            } catch (const WfgException& e) {
                record({"Image data", false, e.message()});
            }
        }
    }

    printSummary();

    if (summary_.passed()) {
        return toExitCode(ErrorCode::kSuccess);
    }
    return summary_.checksumFailures == summary_.failedChecks
               ? toExitCode(ErrorCode::kChecksumError)
               : toExitCode(ErrorCode::kFormatError);
}

void VerifyCommand::printSummary() const {
    out_ << "\n=== Verification Summary ===\n";
    out_ << fmt::format("Checks: {} total, {} passed, {} failed\n", summary_.totalChecks,
                        summary_.passedChecks, summary_.failedChecks);
    out_ << "Status: " << (summary_.passed() ? "VALID" : "INVALID") << std::endl;
}

std::unique_ptr<VerifyCommand> createVerifyCommand(const std::string& inputPath, bool verbose) {
    VerifyOptions opts;
    opts.inputPath = inputPath;
    opts.verbose = verbose;
    return std::make_unique<VerifyCommand>(std::move(opts));
}

}  // namespace wfg::commands
