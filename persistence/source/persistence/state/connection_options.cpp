#include <persistence/state/connection_options.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, ConnectionOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, knownHostsFile);
        TO_JSON_OPTIONAL(j, options, connectTimeoutSeconds);
        TO_JSON_OPTIONAL(j, options, compression);
        TO_JSON_OPTIONAL(j, options, tryAgentForAuthentication);
        TO_JSON_OPTIONAL(j, options, usePublicKeyAutoAuth);
    }
    void from_json(nlohmann::json const& j, ConnectionOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, knownHostsFile);
        FROM_JSON_OPTIONAL(j, options, connectTimeoutSeconds);
        FROM_JSON_OPTIONAL(j, options, compression);
        FROM_JSON_OPTIONAL(j, options, tryAgentForAuthentication);
        FROM_JSON_OPTIONAL(j, options, usePublicKeyAutoAuth);
    }

    void ConnectionOptions::useDefaultsFrom(ConnectionOptions const& other)
    {
        USE_DEFAULT_IF_UNSET(knownHostsFile, other);
        USE_DEFAULT_IF_UNSET(connectTimeoutSeconds, other);
        USE_DEFAULT_IF_UNSET(compression, other);
        USE_DEFAULT_IF_UNSET(tryAgentForAuthentication, other);
        USE_DEFAULT_IF_UNSET(usePublicKeyAutoAuth, other);
    }
}
