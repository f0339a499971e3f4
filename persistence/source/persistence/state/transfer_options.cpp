#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, chunkSize);
        TO_JSON_OPTIONAL(j, options, futureTimeoutSeconds);
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, chunkSize);
        FROM_JSON_OPTIONAL(j, options, futureTimeoutSeconds);
    }

    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        USE_DEFAULT_IF_UNSET(chunkSize, other);
        USE_DEFAULT_IF_UNSET(futureTimeoutSeconds, other);
    }
}
