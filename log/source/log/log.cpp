#include <log/log.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>

namespace Log
{
    namespace
    {
        spdlog::level::level_enum toSpdlog(Level level)
        {
            switch (level)
            {
                case Level::Trace:
                    return spdlog::level::trace;
                case Level::Debug:
                    return spdlog::level::debug;
                case Level::Info:
                    return spdlog::level::info;
                case Level::Warning:
                    return spdlog::level::warn;
                case Level::Error:
                    return spdlog::level::err;
                case Level::Critical:
                    return spdlog::level::critical;
                case Level::Off:
                    return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        Level fromSpdlog(spdlog::level::level_enum level)
        {
            switch (level)
            {
                case spdlog::level::trace:
                    return Level::Trace;
                case spdlog::level::debug:
                    return Level::Debug;
                case spdlog::level::warn:
                    return Level::Warning;
                case spdlog::level::err:
                    return Level::Error;
                case spdlog::level::critical:
                    return Level::Critical;
                case spdlog::level::off:
                    return Level::Off;
                default:
                    return Level::Info;
            }
        }

        struct Sinks
        {
            Sinks()
                : guard{}
                , logger{std::make_shared<spdlog::logger>(
                      "sftpx", std::make_shared<spdlog::sinks::stderr_color_sink_mt>())}
            {
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
                logger->set_level(toSpdlog(levelFromEnvironment()));
            }

            // Sink list changes are guarded, spdlog only locks individual sinks.
            std::mutex guard;
            std::shared_ptr<spdlog::logger> logger;
        };

        Sinks& sinks()
        {
            static Sinks instance{};
            return instance;
        }
    }

    void write(Level level, std::string const& message)
    {
        auto& target = sinks();
        std::scoped_lock lock{target.guard};
        target.logger->log(toSpdlog(level), message);
    }

    bool enabled(Level level)
    {
        return sinks().logger->should_log(toSpdlog(level));
    }

    void setLevel(Level level)
    {
        sinks().logger->set_level(toSpdlog(level));
    }

    Level level()
    {
        return fromSpdlog(sinks().logger->level());
    }

    void flush()
    {
        auto& target = sinks();
        std::scoped_lock lock{target.guard};
        target.logger->flush();
    }

    void setupFileLogging(std::filesystem::path const& path)
    {
        {
            auto& target = sinks();
            std::scoped_lock lock{target.guard};
            target.logger->sinks().push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
        }
        info("Logging to file '{}'", path.string());
    }
}
