/*
 * File: include/relay_log.hpp
 * Project: Display Relay
 * Purpose: Thread-safe line logging shared by the server threads
 * Notes:
 *  - info/debug -> stdout, warn/error -> stderr, one flushed line per call
 *  - debug is emitted only when RELAY_DEBUG is set
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

class Log
{
public:
    enum class Level
    {
        Debug,
        Info,
        Warn,
        Error
    };

    static void debug(const std::string &tag, const std::string &msg)
    {
        if (std::getenv("RELAY_DEBUG") == nullptr)
            return;
        emit(Level::Debug, tag, msg);
    }
    static void info(const std::string &tag, const std::string &msg) { emit(Level::Info, tag, msg); }
    static void warn(const std::string &tag, const std::string &msg) { emit(Level::Warn, tag, msg); }
    static void error(const std::string &tag, const std::string &msg) { emit(Level::Error, tag, msg); }

    // Test hook: receives every emitted line with its level. nullptr clears.
    static void set_sink(std::function<void(Level, const std::string &)> sink)
    {
        std::scoped_lock lk(mutex_);
        sink_ = std::move(sink);
    }

    static const char *level_name(Level l)
    {
        switch (l)
        {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        }
        return "?";
    }

private:
    static inline std::mutex mutex_;
    static inline std::function<void(Level, const std::string &)> sink_;

    // 2026-10-18T14:59:01.234Z
    static std::string timestamp()
    {
        using namespace std::chrono;
        auto now = time_point_cast<milliseconds>(system_clock::now());
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
        std::time_t tt = system_clock::to_time_t(now);
        std::tm tm{};
        gmtime_r(&tt, &tm);
        char base[32];
        std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);
        std::ostringstream oss;
        oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
        return oss.str();
    }

    static void emit(Level level, const std::string &tag, const std::string &msg)
    {
        std::string line = timestamp() + " " + level_name(level) + " [" + tag + "] " + msg;
        std::scoped_lock lk(mutex_);
        if (sink_)
            sink_(level, line);
        std::ostream &os = (level == Level::Warn || level == Level::Error) ? std::cerr : std::cout;
        os << line << '\n';
        os.flush();
    }
};
