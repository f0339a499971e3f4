#pragma once

#include <ssh/host_key.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace SecureShell
{
    struct TransportOptions
    {
        std::chrono::seconds timeout{10};
        bool compression{true};
    };

    /**
     * @brief The authentication methods a server offers for a user.
     */
    struct AuthenticationMethods
    {
        bool publicKey{false};
        bool password{false};
        bool keyboardInteractive{false};
        bool hostBased{false};
        bool gssapi{false};

        bool operator==(AuthenticationMethods const&) const = default;
    };

    /**
     * @brief The primitives of an ssh session that are needed to establish it.
     */
    class ISessionBackend
    {
      public:
        virtual ~ISessionBackend() = default;

        /**
         * @brief Opens the transport and performs the key exchange.
         *
         * @param port std::nullopt lets the library pick the port (ssh config or its default).
         * @return The library error message on failure.
         */
        virtual std::expected<void, std::string> connect(
            std::string const& host,
            std::optional<std::uint16_t> port,
            std::string const& user,
            TransportOptions const& options) = 0;

        /**
         * @brief The port the transport is actually connected to.
         */
        virtual std::uint16_t connectedPort() const = 0;

        virtual std::expected<HostKey, std::string> serverHostKey() = 0;

        virtual AuthenticationMethods authenticationMethods() = 0;
        virtual bool authenticateWithAgent() = 0;
        virtual bool authenticateWithPublicKeyAuto() = 0;
        virtual bool authenticateWithPassword(std::string const& password) = 0;
        virtual bool isAuthenticated() const = 0;
    };
}
