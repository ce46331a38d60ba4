#pragma once

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

#include "core/config.hpp"

namespace camrelay {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

bool parseLogLevel(const std::string& s, LogLevel& out);
const char* logLevelName(LogLevel level);

// Process-wide log sink. Lines look like
//   2026-10-19 06:00:00,123 [INFO] camera0: opened with backend V4L2
// and go to the console stream and, when enabled, to a file that rotates at
// local midnight to <stem>.YYYY-MM-DD.log.
class Logger {
public:
    static Logger& instance();

    bool configure(const LoggingConfig& cfg, std::string& error);
    void setLevel(LogLevel level);
    LogLevel level() const;

    // Console sink; nullptr silences console output. Defaults to std::cerr.
    void setConsole(std::ostream* os);
    void closeFile();

    void write(LogLevel level, const std::string& tag, const std::string& message);

private:
    Logger();

    bool openFileLocked(std::string& error);
    void rotateIfNeededLocked(const std::string& today);
    void pruneBackupsLocked();

    mutable std::mutex mutex_;
    LogLevel level_{LogLevel::Info};
    std::ostream* console_{nullptr};
    bool file_enabled_{false};
    std::string directory_;
    std::string file_name_;
    int backup_count_{7};
    std::ofstream file_;
    std::string file_date_;
};

void logDebug(const std::string& tag, const std::string& message);
void logInfo(const std::string& tag, const std::string& message);
void logWarning(const std::string& tag, const std::string& message);
void logError(const std::string& tag, const std::string& message);

}  // namespace camrelay
