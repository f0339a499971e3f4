#pragma once

#include <ssh/connection_error.hpp>
#include <ssh/session_backend.hpp>
#include <ssh/trust_store.hpp>
#include <ssh/user_prompter.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace SecureShell
{
    struct EstablishOptions
    {
        std::string destination{};
        /// Unparsed, as given by the user.
        std::optional<std::string> port{};
        std::string user{};
        TransportOptions transport{};
        bool tryAgentForAuthentication{true};
        bool usePublicKeyAutoAuth{true};
    };

    /**
     * @brief Brings a session from nothing to authenticated: transport, host trust and user authentication.
     */
    class SessionEstablisher
    {
      public:
        constexpr static int maximumAuthenticationRounds = 3;
        constexpr static int maximumPasswordAttempts = 3;

        SessionEstablisher(ISessionBackend& backend, ITrustStore& trustStore, IUserPrompter& prompter);

        std::expected<void, ConnectionError> establish(EstablishOptions const& options);

        /**
         * @brief Accepts decimal numbers in 1..65535 only.
         */
        static std::expected<std::uint16_t, ConnectionError> parsePort(std::string_view port);

        /**
         * @brief "y" and "yes" in any case, surrounding whitespace ignored.
         */
        static bool isAffirmative(std::string_view answer);

      private:
        std::expected<void, ConnectionError> connectTransport(
            EstablishOptions const& options,
            std::optional<std::uint16_t> port);
        std::expected<void, ConnectionError> verifyHost(std::string const& host);
        std::expected<void, ConnectionError> authenticate(EstablishOptions const& options);

      private:
        ISessionBackend* backend_;
        ITrustStore* trustStore_;
        IUserPrompter* prompter_;
    };
}
