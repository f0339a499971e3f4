#pragma once

#include <spdlog/spdlog.h>

#include <utility/algorithm/case_convert.hpp>

#include <optional>
#include <string>
#include <string_view>

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

    inline spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        switch (lvl)
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
            default:
                return spdlog::level::info;
        }
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum lvl)
    {
        switch (lvl)
        {
            case spdlog::level::trace:
                return Level::Trace;
            case spdlog::level::debug:
                return Level::Debug;
            case spdlog::level::info:
                return Level::Info;
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

    /**
     * @brief Parses a level name. "warn" and "warning" are both accepted.
     *
     * @return std::nullopt for unknown names.
     */
    inline std::optional<Level> parseLevel(std::string_view str)
    {
        const std::string lowered = Utility::Algorithm::toLowerCase(Utility::Algorithm::trim(str));

        if (lowered == "trace")
            return Level::Trace;
        if (lowered == "debug")
            return Level::Debug;
        if (lowered == "info")
            return Level::Info;
        if (lowered == "warning" || lowered == "warn")
            return Level::Warning;
        if (lowered == "error")
            return Level::Error;
        if (lowered == "critical")
            return Level::Critical;
        if (lowered == "off")
            return Level::Off;
        return std::nullopt;
    }

    inline Level levelFromString(std::string_view str)
    {
        return parseLevel(str).value_or(Level::Info);
    }

    inline std::string levelToString(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return "trace";
            case Level::Debug:
                return "debug";
            case Level::Info:
                return "info";
            case Level::Warning:
                return "warning";
            case Level::Error:
                return "error";
            case Level::Critical:
                return "critical";
            case Level::Off:
                return "off";
            default:
                return "info";
        }
    }
}
