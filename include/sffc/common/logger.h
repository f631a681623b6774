// =============================================================================
// sff-codec - Logger Module
// =============================================================================
// Diagnostics for the codec through the Quill asynchronous logger.
//
// The decoders and the writer only emit through the SFFC_LOG_* macros, which
// are no-ops until a logger has been initialized. A host application that
// never configures logging therefore gets no output and no backend thread.
//
// Logging can be enabled in code:
//   sffc::log::init("sffc.log", sffc::log::Level::kDebug);
//
// or from the environment, without touching the host application:
//   SFFC_LOG_LEVEL=debug SFFC_LOG_FILE=/tmp/sffc.log ./host
//   sffc::log::initFromEnvironment();
// =============================================================================

#ifndef SFFC_COMMON_LOGGER_H
#define SFFC_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace sffc::log {

/// @brief Log levels, mapped one to one onto Quill's.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Environment variable naming the level for initFromEnvironment().
inline constexpr const char* kLevelEnvVar = "SFFC_LOG_LEVEL";

/// @brief Environment variable naming an optional log file.
inline constexpr const char* kFileEnvVar = "SFFC_LOG_FILE";

/// @brief Logger setup.
struct Config {
    /// @brief Log file path. Empty disables file output.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Also write to stdout. Forced on when no file is given.
    bool enableConsole = true;

    std::string loggerName = "sffc";
};

/// @brief Initialize the process-wide logger. Later calls are ignored.
void init(const Config& config);

void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Initialize from SFFC_LOG_LEVEL and SFFC_LOG_FILE.
/// @return false, leaving logging off, when the level variable is unset or
///         names no known level.
bool initFromEnvironment();

/// @brief The logger, or nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Change the level of an initialized logger; no-op otherwise.
void setLevel(Level level);

/// @brief Block until queued messages are written.
void flush();

/// @brief Flush, stop the backend thread and return to the silent state.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name, case-insensitively ("warn" and "fatal" accepted).
/// @return kInfo for unknown names.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace sffc::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SFFC_LOG_IMPL_(quill_macro, fmt, ...)                            \
    do {                                                                 \
        if (quill::Logger* sffcLogger_ = ::sffc::log::logger()) {        \
            quill_macro(sffcLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);    \
        }                                                                \
    } while (0)

#define SFFC_LOG_TRACE(fmt, ...) SFFC_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SFFC_LOG_DEBUG(fmt, ...) SFFC_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SFFC_LOG_INFO(fmt, ...) SFFC_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SFFC_LOG_WARNING(fmt, ...) SFFC_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SFFC_LOG_ERROR(fmt, ...) SFFC_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SFFC_LOG_CRITICAL(fmt, ...) SFFC_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SFFC_COMMON_LOGGER_H
