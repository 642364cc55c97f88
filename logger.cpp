#include "logger.h"
#include <ctime>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <thread>
#include <functional>
#include <cstdio>

Logger::Logger() : minLevel(DEBUG) {
}

Logger::~Logger() {
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

bool Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);

    if (logFile.is_open()) {
        logFile.close();
    }
    logPath = path;
    logFile.open(logPath, std::ios::out | std::ios::app);
    return logFile.is_open();
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
    logPath.clear();
}

bool Logger::isOpen() {
    std::lock_guard<std::mutex> lock(logMutex);
    return logFile.is_open();
}

void Logger::setMinLevel(Level level) {
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel = level;
}

void Logger::log(Level level, const char* file, int line, const char* format, ...) {
    std::lock_guard<std::mutex> lock(logMutex);

    if (!logFile.is_open() || level < minLevel) {
        return;
    }

    rotateIfNeeded();
    if (!logFile.is_open()) {
        return;
    }

    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    std::ostringstream logEntry;
    logEntry << "[" << getCurrentTimestamp() << "] "
             << "[" << getLevelString(level) << "] "
             << "[Thread:" << getThreadId() << "] "
             << "[" << file << ":" << line << "] "
             << buffer << '\n';

    logFile << logEntry.str();

    // Flush immediately for ERROR and CRITICAL levels
    if (level >= ERROR) {
        logFile.flush();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

void Logger::rotateIfNeeded() {
    // Mutex should already be locked by caller

    if (getFileSize() < MAX_LOG_SIZE) {
        return;
    }

    logFile.flush();
    logFile.close();

    for (int i = MAX_ROTATED_LOGS; i > 0; i--) {
        std::string oldName = logPath + "." + std::to_string(i);
        std::string newName = logPath + "." + std::to_string(i + 1);

        if (i == MAX_ROTATED_LOGS) {
            unlink(oldName.c_str());
        } else {
            rename(oldName.c_str(), newName.c_str());
        }
    }

    std::string backupName = logPath + ".1";
    rename(logPath.c_str(), backupName.c_str());

    // If this fails the log stays closed and later entries are dropped
    logFile.open(logPath, std::ios::out | std::ios::app);
}

size_t Logger::getFileSize() const {
    struct stat st;
    if (stat(logPath.c_str(), &st) == 0) {
        return st.st_size;
    }
    return 0;
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::getLevelString(Level level) {
    switch (level) {
        case DEBUG:    return "DEBUG";
        case INFO:     return "INFO";
        case WARNING:  return "WARNING";
        case ERROR:    return "ERROR";
        case CRITICAL: return "CRITICAL";
        default:       return "UNKNOWN";
    }
}

unsigned long Logger::getThreadId() {
    return static_cast<unsigned long>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}
