module;
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    // Ordered by severity; a message is printed when its level is at or above
    // the minimum level.
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error,
        Off
    };

    [[nodiscard]] std::string_view LevelToString(Level level);

    // Process-wide threshold. Defaults to Debug in debug builds, Info otherwise.
    void SetMinimumLevel(Level level);
    [[nodiscard]] Level MinimumLevel();
    [[nodiscard]] bool IsEnabled(Level level);

    // Writes one line under the global log lock, colored by level. Warnings and
    // errors go to stderr, everything else to stdout.
    void PrintColored(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Info)) return;
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Warning)) return;
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Error)) return;
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        if (!IsEnabled(Level::Debug)) return;
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
