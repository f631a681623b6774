// =============================================================================
// sff-codec - Logger Module Implementation
// =============================================================================

#include "sffc/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace sffc::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

struct LevelName {
    std::string_view name;
    Level level;
};

/// @brief Accepted level names; the first entry for a level is its canonical name.
constexpr std::array<LevelName, 8> kLevelNames = {{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

std::optional<Level> findLevel(std::string_view text) noexcept {
    const auto matches = [text](const LevelName& entry) {
        return std::equal(entry.name.begin(), entry.name.end(), text.begin(), text.end(),
                          [](char a, char b) {
                              return a == std::tolower(static_cast<unsigned char>(b));
                          });
    };
    const auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(), matches);
    if (it == kLevelNames.end()) {
        return std::nullopt;
    }
    return it->level;
}

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(
        path,
        []() {
            quill::FileSinkConfig fileSinkConfig;
            fileSinkConfig.set_open_mode('w');
            return fileSinkConfig;
        }(),
        quill::FileEventNotifier{});
}

}  // namespace

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
    return findLevel(levelStr).value_or(Level::kInfo);
}

std::string_view levelToString(Level level) noexcept {
    const auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                                 [level](const LevelName& entry) { return entry.level == level; });
    return it == kLevelNames.end() ? std::string_view("info") : it->name;
}

// =============================================================================
// Initialization
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }
    // Console output is the fallback when no file is configured
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

bool initFromEnvironment() {
    const char* levelText = std::getenv(kLevelEnvVar);
    if (levelText == nullptr || *levelText == '\0') {
        return false;
    }
    const std::optional<Level> level = findLevel(levelText);
    if (!level.has_value()) {
        return false;
    }

    Config config;
    config.level = *level;
    if (const char* file = std::getenv(kFileEnvVar); file != nullptr && *file != '\0') {
        config.logFile = file;
        config.enableConsole = false;
    }
    init(config);
    return true;
}

// =============================================================================
// Access
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void setLevel(Level level) {
    if (quill::Logger* current = logger()) {
        current->set_log_level(toQuillLevel(level));
    }
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace sffc::log
