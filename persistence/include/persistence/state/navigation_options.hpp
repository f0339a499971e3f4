#pragma once

#include <persistence/state_core.hpp>

#include <filesystem>
#include <optional>

namespace Persistence
{
    struct NavigationOptions
    {
        std::optional<bool> showHiddenFiles{std::nullopt};
        std::optional<std::filesystem::path> localStartDirectory{std::nullopt};
        /// Unset means the home directory of the remote user.
        std::optional<std::filesystem::path> remoteStartDirectory{std::nullopt};

        void useDefaultsFrom(NavigationOptions const& other);
    };
    void to_json(nlohmann::json& j, NavigationOptions const& options);
    void from_json(nlohmann::json const& j, NavigationOptions& options);
}
