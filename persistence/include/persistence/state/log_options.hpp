#pragma once

#include <log/level.hpp>
#include <persistence/state_core.hpp>

#include <filesystem>
#include <optional>

namespace Log
{
    void to_json(nlohmann::json& j, Level const& level);
    void from_json(nlohmann::json const& j, Level& level);
}

namespace Persistence
{
    struct LogOptions
    {
        std::optional<Log::Level> level{std::nullopt};
        /// Unset discards all log output.
        std::optional<std::filesystem::path> file{std::nullopt};

        void useDefaultsFrom(LogOptions const& other);
    };
    void to_json(nlohmann::json& j, LogOptions const& options);
    void from_json(nlohmann::json const& j, LogOptions& options);
}
