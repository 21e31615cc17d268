#pragma once

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>

namespace Lexicore {

/**
 * @brief Thread-safe logging utility.
 *
 * Writes to std::clog so that API results stay free of console output.
 * The minimum level defaults to Info and can be lowered or raised through
 * LEXICORE_LOG_LEVEL (debug, info, warn, error, off).
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Off
    };

    static void set_level(Level level) { threshold() = level; }
    static Level level() { return threshold(); }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(threshold().load());
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Off:     return;
        }

        std::clog << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{level_from_env()};
        return level;
    }

    static Level level_from_env() {
        const char* env = std::getenv("LEXICORE_LOG_LEVEL");
        if (!env) return Level::Info;
        if (std::strcmp(env, "debug") == 0) return Level::Debug;
        if (std::strcmp(env, "warn") == 0)  return Level::Warning;
        if (std::strcmp(env, "error") == 0) return Level::Error;
        if (std::strcmp(env, "off") == 0)   return Level::Off;
        return Level::Info;
    }
};

} // namespace Lexicore
