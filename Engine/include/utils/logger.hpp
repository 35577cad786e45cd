#pragma once

#include <iostream>
#include <string>
#include <cstdlib>
#include <mutex>

namespace Commpute {

/**
 * @brief Thread-safe logging utility.
 *
 * Writes to stderr so that stdout only carries results. The minimum level is
 * read once from COMMPUTE_LOG_LEVEL (debug, info, warn, error).
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static Level threshold() {
        static const Level level = parse_level(std::getenv("COMMPUTE_LOG_LEVEL"));
        return level;
    }

    static bool enabled(Level level) {
        return rank(level) >= rank(threshold());
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "[debug] "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::cerr << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

    static Level parse_level(const char* name) {
        if (!name) return Level::Info;
        const std::string s(name);
        if (s == "debug") return Level::Debug;
        if (s == "warn" || s == "warning") return Level::Warning;
        if (s == "error") return Level::Error;
        return Level::Info;
    }

private:
    // Step and Success are progress output and rank with Info.
    static int rank(Level level) {
        switch (level) {
            case Level::Debug:   return 0;
            case Level::Info:
            case Level::Step:
            case Level::Success: return 1;
            case Level::Warning: return 2;
            case Level::Error:   return 3;
        }
        return 1;
    }
};

} // namespace Commpute
