// =============================================================================
// wfgen - Object Storage Implementation
// =============================================================================

#include "wfg/storage/object_store.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include "wfg/common/logger.h"

namespace wfg::storage {

bool isSafeObjectKey(std::string_view key) noexcept {
    if (key.empty() || key.front() == '/' || key.back() == '/') {
        return false;
    }

    std::size_t start = 0;
    while (start <= key.size()) {
        std::size_t end = key.find('/', start);
        if (end == std::string_view::npos) {
            end = key.size();
        }
        const auto segment = key.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == ".." ||
            segment.find('\\') != std::string_view::npos) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::string joinPublicUrl(std::string_view baseUrl, std::string_view key) {
    while (!baseUrl.empty() && baseUrl.back() == '/') {
        baseUrl.remove_suffix(1);
    }
    while (!key.empty() && key.front() == '/') {
        key.remove_prefix(1);
    }
    return fmt::format("{}/{}", baseUrl, key);
}

// =============================================================================
// FileObjectStore Implementation
// =============================================================================

FileObjectStore::FileObjectStore(std::filesystem::path root, std::string publicBaseUrl)
    : root_(std::move(root)), publicBaseUrl_(std::move(publicBaseUrl)) {}

Result<std::filesystem::path> FileObjectStore::pathForKey(std::string_view key) const {
    if (!isSafeObjectKey(key)) {
        return makeError<std::filesystem::path>(ErrorCode::kInvalidArgument,
                                                fmt::format("Invalid object key '{}'", key));
    }
    return root_ / std::filesystem::path(std::string(key));
}

Result<std::vector<std::uint8_t>> FileObjectStore::download(std::string_view key) {
    auto path = pathForKey(key);
    if (!path) {
        return std::unexpected(path.error());
    }

    std::ifstream file(*path, std::ios::binary);
    if (!file) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError, fmt::format("Object '{}' not found at {}", key, path->string()));
    }

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    if (file.bad()) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError, fmt::format("Failed to read object '{}'", key));
    }

    WFG_LOG_DEBUG("Downloaded '{}' ({} bytes)", key, bytes.size());
    return bytes;
}

Result<std::string> FileObjectStore::upload(std::string_view key,
                                            std::span<const std::uint8_t> bytes,
                                            std::string_view contentType) {
    auto path = pathForKey(key);
    if (!path) {
        return std::unexpected(path.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(path->parent_path(), ec);
    if (ec) {
        return makeError<std::string>(
            ErrorCode::kStorageError,
            fmt::format("Failed to create {}: {}", path->parent_path().string(), ec.message()));
    }

    // Stage then rename: readers see the old object or the new one, never a mix.
    auto staging = *path;
    staging += ".part";
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return makeError<std::string>(ErrorCode::kStorageError,
                                          fmt::format("Failed to open {}", staging.string()));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(staging, ec);
            return makeError<std::string>(ErrorCode::kStorageError,
                                          fmt::format("Failed to write {}", staging.string()));
        }
    }

    std::filesystem::rename(staging, *path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        return makeError<std::string>(
            ErrorCode::kStorageError,
            fmt::format("Failed to publish {}: {}", path->string(), ec.message()));
    }

    auto url = joinPublicUrl(publicBaseUrl_, key);
    WFG_LOG_DEBUG("Uploaded '{}' ({} bytes, {}) -> {}", key, bytes.size(), contentType, url);
    return url;
}

}  // namespace wfg::storage
