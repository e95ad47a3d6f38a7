// =============================================================================
// wfgen - Object Storage
// =============================================================================
// Key/value blob storage with publicly reachable URLs.
//
// - IObjectStore: download and upload by key
// - FileObjectStore: directory-backed store; key "a/b.png" maps to
//   <root>/a/b.png and is published as <publicBaseUrl>/a/b.png
// =============================================================================

#ifndef WFG_STORAGE_OBJECT_STORE_H
#define WFG_STORAGE_OBJECT_STORE_H

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "wfg/common/error.h"

namespace wfg::storage {

/// @brief Blob store addressed by slash-separated keys.
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    /// @brief Fetch the bytes stored under a key.
    [[nodiscard]] virtual Result<std::vector<std::uint8_t>> download(std::string_view key) = 0;

    /// @brief Store bytes under a key, replacing any previous object.
    /// @return Public URL of the stored object.
    [[nodiscard]] virtual Result<std::string> upload(std::string_view key,
                                                     std::span<const std::uint8_t> bytes,
                                                     std::string_view contentType) = 0;
};

/// @brief Check that a key is relative and never leaves the store root.
[[nodiscard]] bool isSafeObjectKey(std::string_view key) noexcept;

/// @brief Join a base URL and a key with exactly one slash.
[[nodiscard]] std::string joinPublicUrl(std::string_view baseUrl, std::string_view key);

/// @brief Object store backed by a local directory.
class FileObjectStore : public IObjectStore {
public:
    FileObjectStore(std::filesystem::path root, std::string publicBaseUrl);

    [[nodiscard]] Result<std::vector<std::uint8_t>> download(std::string_view key) override;

    [[nodiscard]] Result<std::string> upload(std::string_view key,
                                             std::span<const std::uint8_t> bytes,
                                             std::string_view contentType) override;

    /// @brief Filesystem location of a key.
    [[nodiscard]] Result<std::filesystem::path> pathForKey(std::string_view key) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::string publicBaseUrl_;
};

}  // namespace wfg::storage

#endif  // WFG_STORAGE_OBJECT_STORE_H
