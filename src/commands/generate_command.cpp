// =============================================================================
// wfgen - Generate Command Implementation
// =============================================================================

#include "generate_command.h"

#include <iostream>
#include <memory>

#include "wfg/audio/amplitude_extractor.h"
#include "wfg/common/error.h"
#include "wfg/common/logger.h"
#include "wfg/job/waveform_job.h"
#include "wfg/storage/object_store.h"
#include "wfg/storage/subject_store.h"

namespace wfg::commands {

GenerateCommand::GenerateCommand(GenerateOptions options) : options_(std::move(options)) {}

int GenerateCommand::execute() {
    if (auto valid = options_.storage.validate(); !valid) {
        WFG_LOG_ERROR("{}", valid.error().message());
        return valid.error().exitCode();
    }

    storage::FileObjectStore objects(options_.storage.storageRoot,
                                     options_.storage.publicBaseUrl);
    storage::FileSubjectStore subjects(options_.storage.subjectRoot);

    job::WaveformJob job(options_.waveform, objects, subjects,
                         std::make_unique<audio::FfmpegPcmDecoder>(
                             options_.waveform.decoderPath, options_.waveform.sampleRate));

    auto result = job.run({options_.subjectId, options_.assetKey});
    if (!result) {
        return result.error().exitCode();
    }

    if (job.usedFallback()) {
        WFG_LOG_WARNING("Subject {} rendered with placeholder amplitudes", options_.subjectId);
    }

    std::cout << result->publicUrl << std::endl;
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace wfg::commands
