#include "core/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

#include "core/time_utils.hpp"

namespace camrelay {

namespace fs = std::filesystem;

bool parseLogLevel(const std::string& s, LogLevel& out) {
    if (s == "debug") {
        out = LogLevel::Debug;
    } else if (s == "info") {
        out = LogLevel::Info;
    } else if (s == "warning") {
        out = LogLevel::Warning;
    } else if (s == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

Logger::Logger() : console_(&std::cerr) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool Logger::configure(const LoggingConfig& cfg, std::string& error) {
    LogLevel level = LogLevel::Info;
    if (!parseLogLevel(cfg.level, level)) {
        error = "unknown log level: " + cfg.level;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    console_ = cfg.console ? &std::cerr : nullptr;
    if (file_.is_open()) {
        file_.close();
    }
    file_enabled_ = cfg.file_enabled;
    directory_ = cfg.directory;
    file_name_ = cfg.file_name;
    backup_count_ = cfg.backup_count;
    if (!file_enabled_) {
        error.clear();
        return true;
    }
    return openFileLocked(error);
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setConsole(std::ostream* os) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = os;
}

void Logger::closeFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_enabled_ = false;
}

bool Logger::openFileLocked(std::string& error) {
    std::error_code ec;
    if (!directory_.empty()) {
        fs::create_directories(directory_, ec);
        if (ec) {
            error = "failed to create log directory " + directory_ + ": " + ec.message();
            file_enabled_ = false;
            return false;
        }
    }
    const fs::path path = fs::path(directory_) / file_name_;
    file_.open(path.string(), std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        error = "failed to open log file " + path.string();
        file_enabled_ = false;
        return false;
    }
    file_date_ = localDate();
    error.clear();
    return true;
}

void Logger::rotateIfNeededLocked(const std::string& today) {
    if (today == file_date_) {
        return;
    }
    file_.close();

    const fs::path active = fs::path(directory_) / file_name_;
    const fs::path rotated = fs::path(directory_) /
        (active.stem().string() + "." + file_date_ + ".log");
    std::error_code ec;
    fs::rename(active, rotated, ec);
    if (ec && console_ != nullptr) {
        *console_ << "log rotation failed for " << active.string() << ": " << ec.message() << '\n';
    }
    pruneBackupsLocked();

    std::string error;
    if (!openFileLocked(error) && console_ != nullptr) {
        *console_ << error << '\n';
    }
}

void Logger::pruneBackupsLocked() {
    const fs::path dir = directory_.empty() ? fs::path(".") : fs::path(directory_);
    const std::string prefix = fs::path(file_name_).stem().string() + ".";

    std::vector<fs::path> backups;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        // <stem>.YYYY-MM-DD.log
        if (name.size() == prefix.size() + 14 && name.compare(0, prefix.size(), prefix) == 0 &&
            name.compare(name.size() - 4, 4, ".log") == 0) {
            backups.push_back(it->path());
        }
    }
    if (static_cast<int>(backups.size()) <= backup_count_) {
        return;
    }
    // ISO dates sort lexicographically.
    std::sort(backups.begin(), backups.end());
    const std::size_t excess = backups.size() - static_cast<std::size_t>(backup_count_);
    for (std::size_t i = 0; i < excess; ++i) {
        fs::remove(backups[i], ec);
    }
}

void Logger::write(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }

    std::string line = localTimestamp();
    line += " [";
    line += logLevelName(level);
    line += "] ";
    if (!tag.empty()) {
        line += tag;
        line += ": ";
    }
    line += message;
    line += '\n';

    if (console_ != nullptr) {
        *console_ << line;
        console_->flush();
    }
    if (file_enabled_) {
        rotateIfNeededLocked(localDate());
        if (file_.is_open()) {
            file_ << line;
            file_.flush();
        }
    }
}

void logDebug(const std::string& tag, const std::string& message) {
    Logger::instance().write(LogLevel::Debug, tag, message);
}

void logInfo(const std::string& tag, const std::string& message) {
    Logger::instance().write(LogLevel::Info, tag, message);
}

void logWarning(const std::string& tag, const std::string& message) {
    Logger::instance().write(LogLevel::Warning, tag, message);
}

void logError(const std::string& tag, const std::string& message) {
    Logger::instance().write(LogLevel::Error, tag, message);
}

}  // namespace camrelay
