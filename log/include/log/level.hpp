#pragma once

#include <utility/algorithm/case_convert.hpp>

#include <array>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        inline constexpr std::array<std::pair<std::string_view, Level>, 8> levelNames{{
            {"trace", Level::Trace},
            {"debug", Level::Debug},
            {"info", Level::Info},
            {"warning", Level::Warning},
            {"warn", Level::Warning},
            {"error", Level::Error},
            {"critical", Level::Critical},
            {"off", Level::Off},
        }};
    }

    /**
     * @brief Parses a level name, ignoring case. "warn" is accepted as an alias of "warning".
     */
    inline std::optional<Level> parseLevel(std::string_view name)
    {
        for (auto const& [levelName, level] : Detail::levelNames)
        {
            if (Utility::Algorithm::equalsIgnoreCase(levelName, name))
                return level;
        }
        return std::nullopt;
    }

    inline std::string_view levelName(Level level)
    {
        for (auto const& [name, candidate] : Detail::levelNames)
        {
            if (candidate == level)
                return name;
        }
        return "info";
    }

    /**
     * @brief Level named by SFTPX_LOG_LEVEL, or the fallback when it is unset or not a level name.
     */
    inline Level levelFromEnvironment(Level fallback = Level::Info)
    {
        const char* raw = std::getenv("SFTPX_LOG_LEVEL");
        if (raw == nullptr)
            return fallback;
        return parseLevel(raw).value_or(fallback);
    }
}
