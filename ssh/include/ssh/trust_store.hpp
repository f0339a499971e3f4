#pragma once

#include <ssh/host_key.hpp>

#include <cstdint>
#include <expected>
#include <string>

namespace SecureShell
{
    enum class TrustCheckResult
    {
        Match,
        NotFound,
        Mismatch
    };

    /**
     * @brief Persistent mapping from a host endpoint to the host keys the user accepted for it.
     */
    class ITrustStore
    {
      public:
        virtual ~ITrustStore() = default;

        /**
         * @brief Looks up the endpoint and compares the recorded keys with the presented one.
         *
         * @return The comparison result, or a description of why the store could not be read.
         */
        virtual std::expected<TrustCheckResult, std::string>
        check(std::string const& host, std::uint16_t port, HostKey const& key) = 0;

        /**
         * @brief Records the key for the endpoint and persists the store.
         */
        virtual std::expected<void, std::string>
        add(std::string const& host, std::uint16_t port, HostKey const& key) = 0;

        /**
         * @brief Human readable location of the store, shown when asking the user.
         */
        virtual std::string location() const = 0;
    };
}
