// =============================================================================
// wfgen - Subject Record Store
// =============================================================================
// Single-field updates of the record that owns a waveform.
// =============================================================================

#ifndef WFG_STORAGE_SUBJECT_STORE_H
#define WFG_STORAGE_SUBJECT_STORE_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "wfg/common/error.h"
#include "wfg/common/types.h"

namespace wfg::storage {

/// @brief Writer of the waveform URL field on subject records.
class ISubjectStore {
public:
    virtual ~ISubjectStore() = default;

    /// @brief Set the waveform URL of a subject; no other field is touched.
    [[nodiscard]] virtual VoidResult updateWaveformUrl(SubjectId subjectId,
                                                       std::string_view url) = 0;
};

/// @brief Subject store writing one file per subject: <root>/<id>.waveform_url
class FileSubjectStore : public ISubjectStore {
public:
    explicit FileSubjectStore(std::filesystem::path root);

    [[nodiscard]] VoidResult updateWaveformUrl(SubjectId subjectId,
                                               std::string_view url) override;

    /// @brief Read back a stored URL.
    /// @return The URL, or std::nullopt if none has been written.
    [[nodiscard]] std::optional<std::string> waveformUrl(SubjectId subjectId) const;

    [[nodiscard]] std::filesystem::path recordPath(SubjectId subjectId) const;

private:
    std::filesystem::path root_;
};

}  // namespace wfg::storage

#endif  // WFG_STORAGE_SUBJECT_STORE_H
