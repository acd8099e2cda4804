#pragma once

#include <atomic>
#include <cstdio>
#include <sstream>
#include <string>

#include <boost/thread/mutex.hpp>
#include <boost/thread/tss.hpp>

namespace arcrw {

enum LogLevel {
    LOG_TRACE,    // 逐次挂起/唤醒
    LOG_DEBUG,    // 分配块释放等生命周期事件
    LOG_INFO,
    LOG_WARNING,  // 锁被毒化
    LOG_ERROR,    // 分配失败
    LOG_SEVERE    // 计数溢出，随后 abort
};

// 当前日志级别：小于该值的消息被丢弃
extern std::atomic<int> logLevel;

/**
 * Logger
 * ------------------------------------------------------------
 * 每线程一个实例（boost::thread_specific_ptr），各自缓冲一行，
 * flush 时在全局互斥下写入同一个 FILE*。
 */
class Logger {
public:
    static Logger& Get();

    // 同 Get()，但创建失败（内存不足等）时返回 nullptr 而不抛出
    static Logger* TryGet() noexcept;

    // 设置输出目标；nullptr 恢复为 stderr
    static void SetLogFile(FILE* f);

    Logger& SetLevel(LogLevel l) noexcept {
        level_ = l;
        return *this;
    }

    template<typename T>
    Logger& operator<<(const T& value) {
        ss_ << value;
        return *this;
    }

    // 写出缓冲的一行；格式化失败时丢弃该行并在 stderr 留一条提示
    void Flush() noexcept;

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    static boost::mutex                      sink_mutex_;
    static FILE*                             sink_;
    static boost::thread_specific_ptr<Logger> tsp_;

    std::ostringstream ss_;
    LogLevel           level_ = LOG_INFO;
    std::string        thread_tag_;
};

// 析构时自动 flush 一行；被过滤的级别持有 nullptr，所有输出短路
class LoggerWrapper {
public:
    LoggerWrapper(Logger* logger) noexcept : logger_(logger) {}
    LoggerWrapper(LoggerWrapper&& other) noexcept : logger_(other.logger_) { other.logger_ = nullptr; }
    ~LoggerWrapper() {
        if (logger_) logger_->Flush();
    }

    template<typename T>
    LoggerWrapper& operator<<(const T& value) {
        if (logger_) (*logger_) << value;
        return *this;
    }

    LoggerWrapper(const LoggerWrapper&)            = delete;
    LoggerWrapper& operator=(const LoggerWrapper&) = delete;

private:
    Logger* logger_;
};

inline bool IsLogEnabled(LogLevel l) noexcept {
    return l >= logLevel.load(std::memory_order_relaxed);
}

// 不抛出：锁的释放路径（包括栈展开中的 guard 析构）也会记日志
inline LoggerWrapper log(LogLevel l) noexcept {
    if (!IsLogEnabled(l)) return LoggerWrapper(nullptr);
    Logger* logger = Logger::TryGet();
    return LoggerWrapper(logger ? &logger->SetLevel(l) : nullptr);
}

inline LoggerWrapper trace() noexcept  { return log(LOG_TRACE); }
inline LoggerWrapper debug() noexcept  { return log(LOG_DEBUG); }
inline LoggerWrapper info() noexcept   { return log(LOG_INFO); }
inline LoggerWrapper warn() noexcept   { return log(LOG_WARNING); }
inline LoggerWrapper error() noexcept  { return log(LOG_ERROR); }
inline LoggerWrapper severe() noexcept { return log(LOG_SEVERE); }

// "TRACE" / "DEBUG" / "INFO" / "WARNING"|"WARN" / "ERROR" / "SEVERE"|"FATAL"，大小写不敏感
bool SetLogLevelFromString(const std::string& level);

// 读取环境变量 LOG_LEVEL；非法取值时保持原级别并在 stderr 提示
void InitLoggingFromEnv();

} // namespace arcrw
