module;

#include <atomic>
#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;

import :Logging;

namespace Core::Log
{
    namespace
    {
        std::mutex s_LogMutex;

#ifdef NDEBUG
        std::atomic<Level> s_MinimumLevel{Level::Info};
#else
        std::atomic<Level> s_MinimumLevel{Level::Debug};
#endif
    }

    std::string_view LevelToString(Level level)
    {
        switch (level)
        {
        case Level::Debug:   return "Debug";
        case Level::Info:    return "Info";
        case Level::Warning: return "Warning";
        case Level::Error:   return "Error";
        case Level::Off:     return "Off";
        }
        return "Unknown";
    }

    void SetMinimumLevel(Level level)
    {
        s_MinimumLevel.store(level, std::memory_order_relaxed);
    }

    Level MinimumLevel()
    {
        return s_MinimumLevel.load(std::memory_order_relaxed);
    }

    bool IsEnabled(Level level)
    {
        return level != Level::Off && level >= MinimumLevel();
    }

    void PrintColored(Level level, std::string_view msg)
    {
        const char* color = "\033[0m";
        const char* label = "[INFO] ";
        std::ostream* out = &std::cout;

        switch (level) {
        case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
        case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
        case Level::Warning: color = "\033[33m"; label = "[WARN] "; out = &std::cerr; break; // Yellow
        case Level::Error:   color = "\033[31m"; label = "[ERR]  "; out = &std::cerr; break; // Red
        case Level::Off:     return;
        }

        std::lock_guard lock(s_LogMutex);
        *out << color << label << msg << "\033[0m" << '\n';
        out->flush();
    }
}
