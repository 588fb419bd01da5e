/**
 * @file tftp_logger.h
 * @brief TFTP client logging functionality
 */

#ifndef TFTPCLIENT_TFTP_LOGGER_H_
#define TFTPCLIENT_TFTP_LOGGER_H_

#include "tftpclient/tftp_common.h"
#include <cstdio>
#include <string>
#include <fstream>
#include <mutex>

namespace tftpclient {

// Log level values, plain numbers so #if can compare them
#define TFTPCLIENT_LEVEL_TRACE 0
#define TFTPCLIENT_LEVEL_DEBUG 1
#define TFTPCLIENT_LEVEL_INFO 2
#define TFTPCLIENT_LEVEL_WARN 3
#define TFTPCLIENT_LEVEL_ERROR 4
#define TFTPCLIENT_LEVEL_CRITICAL 5

// Log level definitions
enum LogLevel {
    kLogTrace = TFTPCLIENT_LEVEL_TRACE,
    kLogDebug = TFTPCLIENT_LEVEL_DEBUG,
    kLogInfo = TFTPCLIENT_LEVEL_INFO,
    kLogWarn = TFTPCLIENT_LEVEL_WARN,
    kLogError = TFTPCLIENT_LEVEL_ERROR,
    kLogCritical = TFTPCLIENT_LEVEL_CRITICAL
};

// Build-time log level configuration
#ifndef TFTPCLIENT_LOG_LEVEL
    #if defined(TFTPCLIENT_MINIMAL_LOGGING)
        #define TFTPCLIENT_LOG_LEVEL TFTPCLIENT_LEVEL_ERROR     // Minimal: Only errors and critical
    #elif defined(NDEBUG) || defined(TFTPCLIENT_PRODUCTION_BUILD)
        #define TFTPCLIENT_LOG_LEVEL TFTPCLIENT_LEVEL_WARN      // Production: Warnings, errors, and critical
    #elif defined(_DEBUG) || defined(DEBUG)
        #define TFTPCLIENT_LOG_LEVEL TFTPCLIENT_LEVEL_DEBUG     // Debug: Include debug messages
    #else
        #define TFTPCLIENT_LOG_LEVEL TFTPCLIENT_LEVEL_INFO      // Default: Include info messages
    #endif
#endif

// Compile-time log filtering
#define TFTPCLIENT_LOG_ENABLED(level) (level >= TFTPCLIENT_LOG_LEVEL)

/**
 * @class TftpLogger
 * @brief Process-wide logger shared by every transfer
 *
 * Lines are written to the log file when one is set, otherwise to stderr.
 * Output is serialized by an internal mutex, so independent clients running
 * on different threads may log concurrently.
 */
class TFTPCLIENT_EXPORT TftpLogger {
public:
    /**
     * @brief Get singleton instance
     * @return TftpLogger instance
     */
    static TftpLogger& GetInstance();

    ~TftpLogger();

    /**
     * @brief Redirect output to a file (append mode)
     * @param filename Log filename, empty to go back to stderr
     */
    void SetLogFile(const std::string& filename);

    /**
     * @brief Set runtime log level
     * @param level Minimum level that is written
     */
    void SetLogLevel(int level);

    /**
     * @brief Output log message
     * @param level Log level
     * @param message Log message
     */
    void Log(int level, const std::string& message);

    bool ShouldLog(int level) const {
        return level >= log_level_;
    }

    int GetLogLevel() const {
        return log_level_;
    }

    /**
     * @brief Output printf-style formatted log message
     * @param level Log level
     * @param format Format string
     * @param ... Variable arguments
     */
    template<typename... Args>
    void LogFormat(int level, const char* format, Args... args) {
        if (level >= log_level_) {
            char buffer[1024];
            std::snprintf(buffer, sizeof(buffer), format, args...);
            Log(level, buffer);
        }
    }

    /**
     * @brief Name of a log level as printed in the log line
     */
    static const char* LevelName(int level);

private:
    TftpLogger() : log_level_(TFTPCLIENT_LOG_LEVEL) {}
    TftpLogger(const TftpLogger&) = delete;
    TftpLogger& operator=(const TftpLogger&) = delete;

    int log_level_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Logging macros with compile-time filtering.
// Disabled levels expand to nothing, so no formatting cost is paid.

#if TFTPCLIENT_LOG_ENABLED(TFTPCLIENT_LEVEL_TRACE)
    #define TFTPCLIENT_TRACE(...) tftpclient::TftpLogger::GetInstance().LogFormat(tftpclient::kLogTrace, __VA_ARGS__)
#else
    #define TFTPCLIENT_TRACE(...) ((void)0)
#endif

#if TFTPCLIENT_LOG_ENABLED(TFTPCLIENT_LEVEL_DEBUG)
    #define TFTPCLIENT_DEBUG(...) tftpclient::TftpLogger::GetInstance().LogFormat(tftpclient::kLogDebug, __VA_ARGS__)
#else
    #define TFTPCLIENT_DEBUG(...) ((void)0)
#endif

#if TFTPCLIENT_LOG_ENABLED(TFTPCLIENT_LEVEL_INFO)
    #define TFTPCLIENT_INFO(...) tftpclient::TftpLogger::GetInstance().LogFormat(tftpclient::kLogInfo, __VA_ARGS__)
#else
    #define TFTPCLIENT_INFO(...) ((void)0)
#endif

#if TFTPCLIENT_LOG_ENABLED(TFTPCLIENT_LEVEL_WARN)
    #define TFTPCLIENT_WARN(...) tftpclient::TftpLogger::GetInstance().LogFormat(tftpclient::kLogWarn, __VA_ARGS__)
#else
    #define TFTPCLIENT_WARN(...) ((void)0)
#endif

#if TFTPCLIENT_LOG_ENABLED(TFTPCLIENT_LEVEL_ERROR)
    #define TFTPCLIENT_ERROR(...) tftpclient::TftpLogger::GetInstance().LogFormat(tftpclient::kLogError, __VA_ARGS__)
#else
    #define TFTPCLIENT_ERROR(...) ((void)0)
#endif

} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_LOGGER_H_
