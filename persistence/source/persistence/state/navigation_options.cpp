#include <persistence/state/navigation_options.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, NavigationOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, showHiddenFiles);
        TO_JSON_OPTIONAL(j, options, localStartDirectory);
        TO_JSON_OPTIONAL(j, options, remoteStartDirectory);
    }
    void from_json(nlohmann::json const& j, NavigationOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, showHiddenFiles);
        FROM_JSON_OPTIONAL(j, options, localStartDirectory);
        FROM_JSON_OPTIONAL(j, options, remoteStartDirectory);
    }

    void NavigationOptions::useDefaultsFrom(NavigationOptions const& other)
    {
        USE_DEFAULT_IF_UNSET(showHiddenFiles, other);
        USE_DEFAULT_IF_UNSET(localStartDirectory, other);
        USE_DEFAULT_IF_UNSET(remoteStartDirectory, other);
    }
}
