#include "arcrw/Util/Log.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <thread>

namespace arcrw {

std::atomic<int> logLevel{LOG_WARNING};

boost::mutex                       Logger::sink_mutex_;
FILE*                              Logger::sink_ = nullptr;
boost::thread_specific_ptr<Logger> Logger::tsp_;

namespace {

const char* LevelToString(LogLevel l) noexcept {
    switch (l) {
    case LOG_TRACE:   return "TRACE";
    case LOG_DEBUG:   return "DEBUG";
    case LOG_INFO:    return "INFO";
    case LOG_WARNING: return "WARNING";
    case LOG_ERROR:   return "ERROR";
    case LOG_SEVERE:  return "SEVERE";
    }
    return "UNKNOWN";
}

std::string TimeToString(std::time_t t) {
    char buf[26];
    ctime_r(&t, buf);
    buf[24] = 0; // 去掉 '\n'
    return buf;
}

} // namespace

Logger::Logger() {
    std::ostringstream tag;
    tag << "arcrw:" << std::this_thread::get_id();
    thread_tag_ = tag.str();
}

Logger& Logger::Get() {
    Logger* p = tsp_.get();
    if (p == nullptr) {
        p = new Logger();
        tsp_.reset(p);
    }
    return *p;
}

Logger* Logger::TryGet() noexcept {
    try {
        return &Get();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "arcrw: logger unavailable, dropping log line: %s\n", e.what());
        return nullptr;
    }
}

void Logger::SetLogFile(FILE* f) {
    boost::mutex::scoped_lock lk(sink_mutex_);
    sink_ = f;
}

void Logger::Flush() noexcept {
    try {
        std::ostringstream line;
        line << TimeToString(std::time(nullptr))
             << " [" << thread_tag_ << "] "
             << LevelToString(level_) << ": "
             << ss_.str() << '\n';
        const std::string out = line.str();

        boost::mutex::scoped_lock lk(sink_mutex_);
        FILE* f = sink_ ? sink_ : stderr;
        if (std::fputs(out.c_str(), f) >= 0) {
            std::fflush(f);
        } else {
            std::cerr << "arcrw: failed to write log line: " << out;
        }
    } catch (const std::exception& e) {
        // 拼行或加锁失败：只丢掉这一行
        std::fprintf(stderr, "arcrw: dropped log line: %s\n", e.what());
    }

    ss_.str("");
    ss_.clear();
    level_ = LOG_INFO;
}

bool SetLogLevelFromString(const std::string& level) {
    std::string upper = level;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    if (upper == "TRACE")   { logLevel.store(LOG_TRACE,   std::memory_order_relaxed); return true; }
    if (upper == "DEBUG")   { logLevel.store(LOG_DEBUG,   std::memory_order_relaxed); return true; }
    if (upper == "INFO")    { logLevel.store(LOG_INFO,    std::memory_order_relaxed); return true; }
    if (upper == "WARNING" || upper == "WARN") { logLevel.store(LOG_WARNING, std::memory_order_relaxed); return true; }
    if (upper == "ERROR")   { logLevel.store(LOG_ERROR,   std::memory_order_relaxed); return true; }
    if (upper == "SEVERE" || upper == "FATAL") { logLevel.store(LOG_SEVERE, std::memory_order_relaxed); return true; }

    return false;
}

void InitLoggingFromEnv() {
    const char* env_level = std::getenv("LOG_LEVEL");
    if (env_level && !SetLogLevelFromString(env_level)) {
        std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                  << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
    }
}

} // namespace arcrw
