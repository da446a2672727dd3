#ifndef IDCROP_LOGGER_H
#define IDCROP_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <optional>
#include <cstddef>

namespace idcrop {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();

    // Log to a file instead of stderr (falls back to stderr if it can't be opened)
    void setLogFile(const std::string& path);
    void setLogLevel(LogLevel level);
    void setMaxLogLines(size_t max_lines);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // One line per processed image
    void extractionSummary(size_t detected, size_t kept, size_t cropped,
                           const std::string& status, double duration_ms);

    // "debug", "info", "warning"/"warn", "error" (case-insensitive)
    static std::optional<LogLevel> parseLevel(const std::string& text);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    void rotateLogIfNeeded();

    std::ofstream log_file_;
    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::WARNING;
    bool console_output_ = true;
    std::string log_file_path_;
    size_t max_log_lines_ = 1000;
    size_t log_counter_ = 0;
};

} // namespace idcrop

#endif // IDCROP_LOGGER_H
