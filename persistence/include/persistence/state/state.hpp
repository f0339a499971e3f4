#pragma once

#include <persistence/state_core.hpp>
#include <persistence/state/connection_options.hpp>
#include <persistence/state/log_options.hpp>
#include <persistence/state/navigation_options.hpp>
#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    struct State
    {
        ConnectionOptions connection{};
        NavigationOptions navigation{};
        TransferOptions transfer{};
        LogOptions log{};

        /**
         * @brief The values used for everything the configuration file leaves out.
         */
        static State defaults();

        void useDefaultsFrom(State const& other);
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
