#pragma once

#include <persistence/state_core.hpp>

#include <filesystem>
#include <optional>

namespace Persistence
{
    struct ConnectionOptions
    {
        std::optional<std::filesystem::path> knownHostsFile{std::nullopt};
        std::optional<int> connectTimeoutSeconds{std::nullopt};
        std::optional<bool> compression{std::nullopt};
        std::optional<bool> tryAgentForAuthentication{std::nullopt};
        std::optional<bool> usePublicKeyAutoAuth{std::nullopt};

        void useDefaultsFrom(ConnectionOptions const& other);
    };
    void to_json(nlohmann::json& j, ConnectionOptions const& options);
    void from_json(nlohmann::json const& j, ConnectionOptions& options);
}
