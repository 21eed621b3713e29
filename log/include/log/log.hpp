#pragma once

#include <log/level.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    /**
     * @brief Hands a finished message to the sinks. Filtering by level happens in log().
     */
    void write(Level level, std::string const& message);

    bool enabled(Level level);
    void setLevel(Level level);
    Level level();
    void flush();

    /**
     * @brief Adds a file sink next to stderr. The file is truncated when opened.
     */
    void setupFileLogging(std::filesystem::path const& path);

    template <typename... Args>
    void log(Level level, std::string_view format, Args&&... args)
    {
        if (!enabled(level))
            return;
        write(level, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
    }

    template <typename... Args>
    void trace(std::string_view format, Args&&... args)
    {
        log(Level::Trace, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug(std::string_view format, Args&&... args)
    {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info(std::string_view format, Args&&... args)
    {
        log(Level::Info, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn(std::string_view format, Args&&... args)
    {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error(std::string_view format, Args&&... args)
    {
        log(Level::Error, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void critical(std::string_view format, Args&&... args)
    {
        log(Level::Critical, format, std::forward<Args>(args)...);
    }

    /**
     * @brief Sets the level for the lifetime of the object and restores the previous one afterwards.
     */
    class ScopedLevel
    {
      public:
        explicit ScopedLevel(Level temporary)
            : previous_{level()}
        {
            setLevel(temporary);
        }
        ~ScopedLevel()
        {
            setLevel(previous_);
        }
        ScopedLevel(ScopedLevel const&) = delete;
        ScopedLevel& operator=(ScopedLevel const&) = delete;

      private:
        Level previous_;
    };
}
