#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <ctime>
#include <mutex>

#include "tftpclient/tftp_logger.h"

namespace tftpclient {

TftpLogger& TftpLogger::GetInstance() {
    static TftpLogger instance;
    return instance;
}

TftpLogger::~TftpLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void TftpLogger::SetLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (!filename.empty()) {
        log_file_.open(filename, std::ios::app);
    }
}

void TftpLogger::SetLogLevel(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_level_ = level;
}

const char* TftpLogger::LevelName(int level) {
    switch (level) {
        case kLogTrace: return "TRACE";
        case kLogDebug: return "DEBUG";
        case kLogInfo: return "INFO";
        case kLogWarn: return "WARN";
        case kLogError: return "ERROR";
        case kLogCritical: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

void TftpLogger::Log(int level, const std::string& message) {
    if (level < log_level_) return;

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm time_info;
    localtime_r(&time, &time_info);

    std::stringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count()
       << " [" << LevelName(level) << "] " << message << std::endl;

    if (log_file_.is_open()) {
        log_file_ << ss.str();
        log_file_.flush();
    } else {
        std::cerr << ss.str();
    }
}

} // namespace tftpclient
