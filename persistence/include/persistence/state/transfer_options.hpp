#pragma once

#include <persistence/state_core.hpp>

#include <cstddef>
#include <optional>

namespace Persistence
{
    struct TransferOptions
    {
        std::optional<std::size_t> chunkSize{std::nullopt};
        std::optional<int> futureTimeoutSeconds{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);
}
