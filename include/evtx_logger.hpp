#ifndef EVTX_LOGGER_HPP
#define EVTX_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <ctime>
#include <mutex>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace evtx {

// 日志等级枚举
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// 日志系统类
class Logger {
public:
    // 获取单例实例
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        log_level_ = level;
    }

    // 按名称设置日志等级（debug, info, warning, error, critical），名称无效时返回false
    bool setLogLevel(const std::string& name) {
        LogLevel level;
        if (!parseLogLevel(name, level)) {
            return false;
        }
        setLogLevel(level);
        return true;
    }

    LogLevel getLogLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_level_;
    }

    bool isEnabled(LogLevel level) const {
        return level >= getLogLevel();
    }

    // 设置日志文件路径，打开失败返回false
    bool setLogFile(const std::string& file_path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(file_path, std::ios::out | std::ios::app);
        return log_file_.is_open();
    }

    void closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    void setConsoleOutput(bool enable) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_output_ = enable;
    }

    static bool parseLogLevel(const std::string& name, LogLevel& level) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") {
            level = LogLevel::DEBUG;
        } else if (lower == "info") {
            level = LogLevel::INFO;
        } else if (lower == "warning" || lower == "warn") {
            level = LogLevel::WARNING;
        } else if (lower == "error") {
            level = LogLevel::ERROR;
        } else if (lower == "critical") {
            level = LogLevel::CRITICAL;
        } else {
            return false;
        }
        return true;
    }

    // 参数直接拼接
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::stringstream ss;
        writePrefix(ss, level);
        printArgs(ss, std::forward<Args>(args)...);
        emit(level, ss.str());
    }

    // 支持{}占位符
    template<typename... Args>
    void logf(LogLevel level, const std::string& format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::stringstream ss;
        writePrefix(ss, level);
        printfArgs(ss, format, 0, std::forward<Args>(args)...);
        emit(level, ss.str());
    }

private:
    Logger() : log_level_(LogLevel::INFO), console_output_(true) {}

    ~Logger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writePrefix(std::stringstream& ss, LogLevel level) {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm{};
        localtime_r(&now_c, &now_tm);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        ss << "[" << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << "."
           << std::setw(3) << std::setfill('0') << now_ms.count() << "] "
           << "[" << levelToString(level) << "] ";
    }

    void emit(LogLevel level, const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_output_) {
            std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::clog;
            out << entry << std::endl;
        }
        if (log_file_.is_open()) {
            log_file_ << entry << std::endl;
        }
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRITICAL";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T, typename... Args>
    static void printArgs(std::stringstream& ss, T&& arg, Args&&... args) {
        ss << std::forward<T>(arg);
        if constexpr (sizeof...(args) > 0) {
            printArgs(ss, std::forward<Args>(args)...);
        }
    }

    static void printArgs(std::stringstream& /*unused*/) {}

    // 逐个替换{}占位符，多余的占位符原样保留
    template<typename T, typename... Args>
    static void printfArgs(std::stringstream& ss, const std::string& format, size_t pos, T&& arg, Args&&... args) {
        size_t placeholder_pos = format.find("{}", pos);
        if (placeholder_pos == std::string::npos) {
            ss << format.substr(pos);
            return;
        }
        ss << format.substr(pos, placeholder_pos - pos) << std::forward<T>(arg);
        printfArgs(ss, format, placeholder_pos + 2, std::forward<Args>(args)...);
    }

    static void printfArgs(std::stringstream& ss, const std::string& format, size_t pos) {
        ss << format.substr(std::min(pos, format.size()));
    }

    LogLevel log_level_;
    bool console_output_;
    std::ofstream log_file_;
    mutable std::mutex mutex_;
};

// 全局日志宏
#define EVTX_LOG_DEBUG(...) ::evtx::Logger::getInstance().log(::evtx::LogLevel::DEBUG, __VA_ARGS__)
#define EVTX_LOG_INFO(...) ::evtx::Logger::getInstance().log(::evtx::LogLevel::INFO, __VA_ARGS__)
#define EVTX_LOG_WARNING(...) ::evtx::Logger::getInstance().log(::evtx::LogLevel::WARNING, __VA_ARGS__)
#define EVTX_LOG_ERROR(...) ::evtx::Logger::getInstance().log(::evtx::LogLevel::ERROR, __VA_ARGS__)
#define EVTX_LOG_CRITICAL(...) ::evtx::Logger::getInstance().log(::evtx::LogLevel::CRITICAL, __VA_ARGS__)

// 格式化版本日志宏
#define EVTX_LOG_DEBUGF(...) ::evtx::Logger::getInstance().logf(::evtx::LogLevel::DEBUG, __VA_ARGS__)
#define EVTX_LOG_INFOF(...) ::evtx::Logger::getInstance().logf(::evtx::LogLevel::INFO, __VA_ARGS__)
#define EVTX_LOG_WARNINGF(...) ::evtx::Logger::getInstance().logf(::evtx::LogLevel::WARNING, __VA_ARGS__)
#define EVTX_LOG_ERRORF(...) ::evtx::Logger::getInstance().logf(::evtx::LogLevel::ERROR, __VA_ARGS__)
#define EVTX_LOG_CRITICALF(...) ::evtx::Logger::getInstance().logf(::evtx::LogLevel::CRITICAL, __VA_ARGS__)

} // namespace evtx

#endif // EVTX_LOGGER_HPP
