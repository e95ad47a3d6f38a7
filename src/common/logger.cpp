// =============================================================================
// wfgen - Logger Module Implementation
// =============================================================================

#include "wfg/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>
#include <quill/sinks/RotatingFileSink.h>

namespace wfg::log {

namespace {

constexpr const char* kLoggerName = "wfg";

struct LevelName {
    std::string_view name;
    Level level;
};

// First entry per level is its canonical name.
constexpr std::array<LevelName, 8> kLevelNames{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

/// @brief Logger state; the pointer is read lock-free by the WFG_LOG_* macros.
struct State {
    std::mutex mutex;
    std::atomic<quill::Logger*> logger{nullptr};
    std::filesystem::path logFile;
};

State& state() {
    static State instance;
    return instance;
}

char openModeFor(FileMode mode) noexcept {
    return mode == FileMode::kTruncate ? 'w' : 'a';
}

std::shared_ptr<quill::Sink> makeFileSink(const Config& config) {
    const std::string path = config.logFile.string();

    if (config.rotateBytes == 0) {
        quill::FileSinkConfig sinkConfig;
        sinkConfig.set_open_mode(openModeFor(config.fileMode));
        return quill::Frontend::create_or_get_sink<quill::FileSink>(path, sinkConfig,
                                                                     quill::FileEventNotifier{});
    }

    quill::RotatingFileSinkConfig sinkConfig;
    sinkConfig.set_open_mode(openModeFor(config.fileMode));
    sinkConfig.set_rotation_max_file_size(config.rotateBytes);
    sinkConfig.set_max_backup_files(config.maxBackups);
    sinkConfig.set_overwrite_rolled_files(true);
    return quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
        path, sinkConfig, quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Config
// =============================================================================

VoidResult Config::validate() const {
    if (rotateBytes > 0 && logFile.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "Log rotation requires a log file");
    }
    if (rotateBytes > 0 && maxBackups == 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             "Log rotation needs at least one backup file");
    }
    if (!logFile.empty() && std::filesystem::is_directory(logFile)) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("Log file {} is a directory", logFile.string()));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Levels
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    std::array<char, 16> lower{};
    if (levelStr.size() > lower.size()) {
        return Level::kInfo;
    }
    std::transform(levelStr.begin(), levelStr.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string_view key(lower.data(), levelStr.size());

    const auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                                  [key](const LevelName& entry) { return entry.name == key; });
    return it == kLevelNames.end() ? Level::kInfo : it->level;
}

std::string_view levelToString(Level level) noexcept {
    const auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                                  [level](const LevelName& entry) { return entry.level == level; });
    return it == kLevelNames.end() ? "info" : it->name;
}

Level levelFromVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    unwrapOrThrow(config.validate());

    State& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.logger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));

    s.logFile = config.logFile;
    s.logger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return state().logger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

std::filesystem::path activeLogFile() {
    State& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.logFile;
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    State& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    quill::Logger* current = s.logger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
    s.logFile.clear();
}

}  // namespace wfg::log
