// =============================================================================
// cidc-upload - Logger Module Implementation
// =============================================================================

#include "cidc/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace cidc::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};
std::atomic<bool> gInitialized{false};
std::mutex gInitMutex;

struct LevelName {
    std::string_view name;
    Level level;
};

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

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileSinkConfig;
        // Successive invocations share one log file
        fileSinkConfig.set_open_mode('a');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileSinkConfig, quill::FileEventNotifier{}));
    }

    // A logger without sinks would drop pipeline errors on the floor
    if (sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    return sinks;
}

}  // namespace

// =============================================================================
// Config
// =============================================================================

Config Config::fromVerbosity(int verbosity, bool quiet) {
    Config config;
    if (quiet) {
        config.level = Level::kError;
    } else if (verbosity >= 2) {
        config.level = Level::kTrace;
    } else if (verbosity == 1) {
        config.level = Level::kDebug;
    }
    return config;
}

// =============================================================================
// Level Conversion
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
    const std::string lower = toLower(levelStr);
    for (const auto& entry : kLevelNames) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

// =============================================================================
// Initialization and Access
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

quill::Logger* logger() {
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr == nullptr) {
        init(Config{});
        loggerPtr = gLogger.load(std::memory_order_acquire);
    }
    return loggerPtr;
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (!isInitialized()) {
        return;
    }
    if (quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire)) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    if (!isInitialized()) {
        return;
    }
    flush();
    quill::Backend::stop();
    gLogger.store(nullptr, std::memory_order_release);
    gInitialized.store(false, std::memory_order_release);
}

}  // namespace cidc::log
