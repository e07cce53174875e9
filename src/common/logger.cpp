// =============================================================================
// linkx - Logger Module Implementation
// =============================================================================
// One Quill logger shared by the command handlers and extractor workers.
// Console output always; a file sink is added when --log-file is given.
// =============================================================================

#include "linkx/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace linkx::log {

namespace {

/// @brief Null until init(), read by every LINKX_LOG_* call site.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() and shutdown().
std::mutex gLifecycleMutex;

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

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    quill::FileSinkConfig fileSinkConfig;
    fileSinkConfig.set_open_mode('w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileSinkConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

Level levelForVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    // Open the file sink before the backend starts, so a bad path leaves
    // nothing running
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));

    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace linkx::log
