#include <persistence/state/state.hpp>

namespace Persistence
{
    State State::defaults()
    {
        return State{
            .connection =
                ConnectionOptions{
                    .knownHostsFile = std::nullopt,
                    .connectTimeoutSeconds = 10,
                    .compression = true,
                    .tryAgentForAuthentication = true,
                    .usePublicKeyAutoAuth = true,
                },
            .navigation =
                NavigationOptions{
                    .showHiddenFiles = false,
                    .localStartDirectory = std::filesystem::path{"."},
                    .remoteStartDirectory = std::nullopt,
                },
            .transfer =
                TransferOptions{
                    .chunkSize = 1024 * 1024,
                    .futureTimeoutSeconds = 30,
                },
            .log =
                LogOptions{
                    .level = Log::Level::Info,
                    .file = std::nullopt,
                },
        };
    }

    void State::useDefaultsFrom(State const& other)
    {
        connection.useDefaultsFrom(other.connection);
        navigation.useDefaultsFrom(other.navigation);
        transfer.useDefaultsFrom(other.transfer);
        log.useDefaultsFrom(other.log);
    }

    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();
        j["connection"] = state.connection;
        j["navigation"] = state.navigation;
        j["transfer"] = state.transfer;
        j["log"] = state.log;
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        if (j.contains("connection"))
            j.at("connection").get_to(state.connection);
        if (j.contains("navigation"))
            j.at("navigation").get_to(state.navigation);
        if (j.contains("transfer"))
            j.at("transfer").get_to(state.transfer);
        if (j.contains("log"))
            j.at("log").get_to(state.log);
    }
}
