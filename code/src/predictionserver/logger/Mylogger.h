#ifndef MYLOGGER_H
#define MYLOGGER_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

class MyLogger
{
public:
    enum class Level
    {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3
    };

    static void debug(const std::string &msg)
    {
        log(Level::Debug, "\033[1;36m[DEBUG] ", msg, std::cout); // Cyan
    }

    static void info(const std::string &msg)
    {
        log(Level::Info, "\033[1;32m[INFO] ", msg, std::cout); // Light green
    }

    static void warning(const std::string &msg)
    {
        log(Level::Warning, "\033[1;33m[WARNING] ", msg, std::cout); // Yellow
    }

    static void error(const std::string &msg)
    {
        log(Level::Error, "\033[1;35m[ERROR] ", msg, std::cerr); // Magenta
    }

    static void setLevel(Level level)
    {
        std::lock_guard<std::mutex> lock(mutex());
        threshold() = level;
    }

    // Accepts "debug", "info", "warning"/"warn", "error". Unknown names fall back to Info.
    static Level levelFromString(const std::string &name)
    {
        if (name == "debug")
            return Level::Debug;
        if (name == "warning" || name == "warn")
            return Level::Warning;
        if (name == "error")
            return Level::Error;
        return Level::Info;
    }

private:
    static void log(Level level, const char *tag, const std::string &msg, std::ostream &out)
    {
        std::lock_guard<std::mutex> lock(mutex());
        if (level < threshold())
            return;
        out << tag << timestamp() << " " << msg << "\033[0m" << std::endl;
    }

    static std::string timestamp()
    {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    static std::mutex &mutex()
    {
        static std::mutex m;
        return m;
    }

    static Level &threshold()
    {
        static Level level = Level::Info;
        return level;
    }
};

#endif // MYLOGGER_H
