// =============================================================================
// wfgen - Subject Record Store Implementation
// =============================================================================

#include "wfg/storage/subject_store.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include "wfg/common/logger.h"

namespace wfg::storage {

namespace {

constexpr std::string_view kRecordSuffix = ".waveform_url";

}  // namespace

FileSubjectStore::FileSubjectStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileSubjectStore::recordPath(SubjectId subjectId) const {
    return root_ / fmt::format("{}{}", subjectId, kRecordSuffix);
}

VoidResult FileSubjectStore::updateWaveformUrl(SubjectId subjectId, std::string_view url) {
    if (subjectId <= 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Invalid subject id {}", subjectId));
    }

    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return makeVoidError(ErrorCode::kPersistenceError,
                             fmt::format("Failed to create {}: {}", root_.string(), ec.message()));
    }

    const auto path = recordPath(subjectId);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return makeVoidError(ErrorCode::kPersistenceError,
                             fmt::format("Failed to open subject record {}", path.string()));
    }
    out << url << '\n';
    out.flush();
    if (!out) {
        return makeVoidError(ErrorCode::kPersistenceError,
                             fmt::format("Failed to write subject record {}", path.string()));
    }

    WFG_LOG_DEBUG("Subject {} waveform URL set to {}", subjectId, url);
    return makeVoidSuccess();
}

std::optional<std::string> FileSubjectStore::waveformUrl(SubjectId subjectId) const {
    std::ifstream in(recordPath(subjectId));
    if (!in) {
        return std::nullopt;
    }
    std::string url;
    std::getline(in, url);
    return url;
}

}  // namespace wfg::storage
