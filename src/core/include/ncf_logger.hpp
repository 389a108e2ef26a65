#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace ncf {

/**
 * @brief Logging levels for netcurfew
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe process logger
 *
 * Console and file sinks, level filtering, millisecond timestamps.
 * The spoof loop, the timer thread and the HTTP workers all log through
 * the same instance.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level >= level_;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    void log(LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_) return;

        std::string line = formatLine(level, msg);

        if (console_enabled_) {
            std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
            out << line << std::endl;
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << line << std::endl;
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none")  return LogLevel::NONE;
        return LogLevel::INFO;
    }

private:
    Logger()
        : level_(LogLevel::INFO)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    static std::string formatLine(LogLevel level, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&t, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] " << msg;
        return oss.str();
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

// Stream-style macros: NCF_LOG_INFO("target " << mac << " resolved")
#define NCF_LOG_AT(lvl, expr)                                              \
    do {                                                                   \
        if (::ncf::Logger::instance().enabled(lvl)) {                      \
            std::ostringstream ncf_log_oss_;                               \
            ncf_log_oss_ << expr;                                          \
            ::ncf::Logger::instance().log(lvl, ncf_log_oss_.str());        \
        }                                                                  \
    } while (0)

#define NCF_LOG_TRACE(expr) NCF_LOG_AT(::ncf::LogLevel::TRACE, expr)
#define NCF_LOG_DEBUG(expr) NCF_LOG_AT(::ncf::LogLevel::DEBUG, expr)
#define NCF_LOG_INFO(expr)  NCF_LOG_AT(::ncf::LogLevel::INFO,  expr)
#define NCF_LOG_WARN(expr)  NCF_LOG_AT(::ncf::LogLevel::WARN,  expr)
#define NCF_LOG_ERROR(expr) NCF_LOG_AT(::ncf::LogLevel::ERROR, expr)
#define NCF_LOG_FATAL(expr) NCF_LOG_AT(::ncf::LogLevel::FATAL, expr)

} // namespace ncf
