#pragma once

#include <string>
#include <sstream>
#include <fstream>
#include <mutex>
#include <atomic>

namespace wordguard {
namespace common {

// Log levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Log configuration
struct LogConfig {
    LogLevel level = LogLevel::WARNING;      // Log level
    std::string log_dir = "./logs";          // Log directory
    std::string log_file = "wordguard.log";  // Log file name
    size_t max_file_size = 10 * 1024 * 1024; // Maximum file size (10MB)
    size_t max_files = 5;                    // Maximum number of files
    bool console_output = true;              // Whether to output to stderr
    bool file_output = false;                // Whether to output to file
};

// Level name conversion ("DEBUG", "INFO", ...); throws ConfigException on unknown names
LogLevel parse_log_level(const std::string& name);
std::string log_level_name(LogLevel level);

// Logger class
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Initialize and clean up
    void initialize(const LogConfig& config);
    void shutdown();

    // Log
    void log(LogLevel level, const char* file, int line, const char* func, const std::string& msg);

    // Log level control
    void set_level(LogLevel level);
    LogLevel get_level() const;

    // Configuration access
    LogConfig config() const;

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Internal helper methods
    void open_log_file();
    void write_to_console(LogLevel level, const std::string& msg);
    void write_to_file(const std::string& msg);
    void rotate_log_files();
    std::string format_message(LogLevel level, const char* file, int line,
                               const char* func, const std::string& msg) const;

    // Member variables
    LogConfig config_;
    std::atomic<LogLevel> level_{LogLevel::WARNING};
    mutable std::mutex mutex_;
    std::ofstream log_file_;
    size_t current_file_size_ = 0;
};

// Log macros
#define LOG_DEBUG(msg) \
    if (wordguard::common::Logger::instance().get_level() <= wordguard::common::LogLevel::DEBUG) \
        wordguard::common::Logger::instance().log(wordguard::common::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    if (wordguard::common::Logger::instance().get_level() <= wordguard::common::LogLevel::INFO) \
        wordguard::common::Logger::instance().log(wordguard::common::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARNING(msg) \
    if (wordguard::common::Logger::instance().get_level() <= wordguard::common::LogLevel::WARNING) \
        wordguard::common::Logger::instance().log(wordguard::common::LogLevel::WARNING, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    if (wordguard::common::Logger::instance().get_level() <= wordguard::common::LogLevel::ERROR) \
        wordguard::common::Logger::instance().log(wordguard::common::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    wordguard::common::Logger::instance().log(wordguard::common::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

} // namespace common
} // namespace wordguard
