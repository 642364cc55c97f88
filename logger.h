#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <cstdarg>

// File-only debug log. Nothing is written until open() succeeds, so the
// tool's stdout/stderr contract is never touched by logging.
class Logger {
public:
    enum Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    // Singleton access
    static Logger& instance();

    // Start appending to `path`. Returns false if the file cannot be opened.
    bool open(const std::string& path);
    void close();

    // isOpen() and setMinLevel() are only used by the tests
    bool isOpen();

    // Entries below this level are dropped. Defaults to DEBUG.
    void setMinLevel(Level level);

    // Main logging function
    void log(Level level, const char* file, int line, const char* format, ...)
        __attribute__((format(printf, 5, 6)));

    // Flush log buffer to disk
    void flush();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    std::mutex logMutex;
    std::ofstream logFile;
    std::string logPath;
    Level minLevel;
    static constexpr size_t MAX_LOG_SIZE = 10 * 1024 * 1024; // 10MB
    static constexpr int MAX_ROTATED_LOGS = 2;

    void rotateIfNeeded();
    size_t getFileSize() const;
    std::string getCurrentTimestamp();
    std::string getLevelString(Level level);
    unsigned long getThreadId();
};

// Convenience macros for easy logging
#define LOG_DEBUG(...) Logger::instance().log(Logger::DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_INFO(...) Logger::instance().log(Logger::INFO, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARNING(...) Logger::instance().log(Logger::WARNING, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...) Logger::instance().log(Logger::ERROR, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_CRITICAL(...) Logger::instance().log(Logger::CRITICAL, __FILE__, __LINE__, __VA_ARGS__)

#endif // LOGGER_H
