// =============================================================================
// wfgen - zlib Deflate Wrapper Implementation
// =============================================================================

#include "wfg/format/deflate.h"

#include <algorithm>
#include <cstring>
#include <string>

#include <zlib.h>

#include "wfg/common/error.h"

namespace wfg::format {

namespace {

/// @brief Output growth step for inflate.
constexpr std::size_t kInflateChunk = 64 * 1024;

/// @brief RAII owner of an inflate z_stream.
class InflateStream {
public:
    InflateStream() {
        std::memset(&stream_, 0, sizeof(z_stream));
        int ret = inflateInit(&stream_);
        if (ret != Z_OK) {
            throw FormatError("Failed to initialize zlib inflate: " + std::string(zError(ret)));
        }
    }

    ~InflateStream() { inflateEnd(&stream_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    [[nodiscard]] z_stream* get() noexcept { return &stream_; }

private:
    z_stream stream_;
};

}  // namespace

std::vector<std::uint8_t> zlibCompress(std::span<const std::uint8_t> data, int level) {
    if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
        throw FormatError("Invalid zlib compression level: " + std::to_string(level));
    }

    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::vector<std::uint8_t> output(bound);

    int ret = compress2(reinterpret_cast<Bytef*>(output.data()), &bound,
                        reinterpret_cast<const Bytef*>(data.data()),
                        static_cast<uLong>(data.size()), level);
    if (ret != Z_OK) {
        throw FormatError("zlib compression failed: " + std::string(zError(ret)));
    }

    output.resize(bound);
    return output;
}

std::vector<std::uint8_t> zlibDecompress(std::span<const std::uint8_t> data,
                                         std::size_t sizeHint, std::size_t maxOutput) {
    InflateStream inflater;
    z_stream* stream = inflater.get();

    // zlib never writes through next_in
    stream->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
    stream->avail_in = static_cast<uInt>(data.size());

    std::size_t reserve = sizeHint > 0 ? std::min(sizeHint, kMaxInflateReserve) : kInflateChunk;
    if (maxOutput > 0) {
        // One spare byte lets an over-long stream be detected
        reserve = std::min(reserve, maxOutput + 1);
    }
    std::vector<std::uint8_t> output(reserve);
    std::size_t produced = 0;

    for (;;) {
        if (produced == output.size()) {
            std::size_t grown = output.size() + std::max(kInflateChunk, output.size() / 2);
            if (maxOutput > 0) {
                grown = std::min(grown, maxOutput + 1);
            }
            output.resize(grown);
        }
        stream->next_out = reinterpret_cast<Bytef*>(output.data() + produced);
        stream->avail_out = static_cast<uInt>(output.size() - produced);

        int ret = inflate(stream, Z_NO_FLUSH);
        produced = output.size() - stream->avail_out;

        if (maxOutput > 0 && produced > maxOutput) {
            throw FormatError("zlib stream inflates past " + std::to_string(maxOutput) +
                              " bytes");
        }

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret == Z_BUF_ERROR && stream->avail_in == 0) {
            throw FormatError("zlib stream is truncated");
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw FormatError("zlib decompression failed: " + std::string(zError(ret)));
        }
    }

    output.resize(produced);
    return output;
}

}  // namespace wfg::format
