#include <persistence/state/log_options.hpp>

namespace Log
{
    void to_json(nlohmann::json& j, Level const& level)
    {
        j = levelToString(level);
    }
    void from_json(nlohmann::json const& j, Level& level)
    {
        level = levelFromString(j.get<std::string>());
    }
}

namespace Persistence
{
    void to_json(nlohmann::json& j, LogOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, level);
        TO_JSON_OPTIONAL(j, options, file);
    }
    void from_json(nlohmann::json const& j, LogOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, level);
        FROM_JSON_OPTIONAL(j, options, file);
    }

    void LogOptions::useDefaultsFrom(LogOptions const& other)
    {
        USE_DEFAULT_IF_UNSET(level, other);
        USE_DEFAULT_IF_UNSET(file, other);
    }
}
