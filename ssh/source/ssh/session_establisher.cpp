#include <ssh/session_establisher.hpp>
#include <log/log.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <fmt/format.h>

#include <charconv>

namespace SecureShell
{
    SessionEstablisher::SessionEstablisher(ISessionBackend& backend, ITrustStore& trustStore, IUserPrompter& prompter)
        : backend_{&backend}
        , trustStore_{&trustStore}
        , prompter_{&prompter}
    {}

    std::expected<std::uint16_t, ConnectionError> SessionEstablisher::parsePort(std::string_view port)
    {
        unsigned int value = 0;
        const auto* end = port.data() + port.size();
        const auto [ptr, ec] = std::from_chars(port.data(), end, value);
        if (port.empty() || ec != std::errc{} || ptr != end || value == 0 || value > 65535)
        {
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::InvalidPortNumber,
                .message = fmt::format("Unable to parse port number \"{}\".", port),
            });
        }
        return static_cast<std::uint16_t>(value);
    }

    bool SessionEstablisher::isAffirmative(std::string_view answer)
    {
        const auto trimmed = Utility::Algorithm::trim(answer);
        return Utility::Algorithm::equalsIgnoreCase(trimmed, "y") ||
            Utility::Algorithm::equalsIgnoreCase(trimmed, "yes");
    }

    std::expected<void, ConnectionError> SessionEstablisher::establish(EstablishOptions const& options)
    {
        std::optional<std::uint16_t> port{};
        if (options.port)
        {
            auto parsed = parsePort(*options.port);
            if (!parsed)
                return std::unexpected(parsed.error());
            port = *parsed;
        }

        if (auto result = connectTransport(options, port); !result)
            return result;

        if (auto result = verifyHost(options.destination); !result)
            return result;

        return authenticate(options);
    }

    std::expected<void, ConnectionError>
    SessionEstablisher::connectTransport(EstablishOptions const& options, std::optional<std::uint16_t> port)
    {
        auto result = backend_->connect(options.destination, port, options.user, options.transport);
        if (!result && !port)
        {
            Log::info(
                "SessionEstablisher: Connecting to '{}' failed ({}), retrying on port 22.",
                options.destination,
                result.error());
            result = backend_->connect(options.destination, std::uint16_t{22}, options.user, options.transport);
        }

        if (!result)
        {
            Log::error("SessionEstablisher: Failed to connect to '{}': {}", options.destination, result.error());
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::TransportFailure,
                .message = result.error(),
            });
        }
        Log::info("SessionEstablisher: Connected to '{}:{}'.", options.destination, backend_->connectedPort());
        return {};
    }

    std::expected<void, ConnectionError> SessionEstablisher::verifyHost(std::string const& host)
    {
        const auto key = backend_->serverHostKey();
        if (!key)
        {
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::HostKeyNotFound,
                .message = key.error(),
            });
        }

        const auto port = backend_->connectedPort();
        const auto checked = trustStore_->check(host, port, *key);
        if (!checked)
        {
            Log::error("SessionEstablisher: Cannot check known hosts: {}", checked.error());
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::HostFileCheckError,
                .message = checked.error(),
            });
        }

        switch (*checked)
        {
            case TrustCheckResult::Match:
                Log::debug("SessionEstablisher: Host key of '{}' is known.", host);
                return {};
            case TrustCheckResult::Mismatch:
            {
                Log::critical(
                    "SessionEstablisher: WARNING: REMOTE HOST IDENTIFICATION HAS CHANGED for '{}:{}'! Someone could be "
                    "eavesdropping on you right now (person in the middle attack).",
                    host,
                    port);
                return std::unexpected(ConnectionError{
                    .type = ConnectionErrorType::MismatchedFingerprint,
                    .message = fmt::format(
                        "REMOTE HOST IDENTIFICATION HAS CHANGED for {}:{}, possible person in the middle attack.",
                        host,
                        port),
                });
            }
            case TrustCheckResult::NotFound:
                break;
        }

        if (!key->fingerprint)
        {
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::HostFingerprintNotFound,
                .message = fmt::format("Unable to get the fingerprint of host {}.", host),
            });
        }

        const auto answer = prompter_->confirmHost(fmt::format(
            "The host key for {} was not found in {}.\nFingerprint: {}\nWould you like to add it (yes/no)? ",
            host,
            trustStore_->location(),
            *key->fingerprint));

        if (!answer || !isAffirmative(*answer))
        {
            Log::warn("SessionEstablisher: User rejected host key of '{}'.", host);
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::HostAuthenticationError,
                .message = fmt::format("The authenticity of host {}:{} cannot be established.", host, port),
            });
        }

        if (auto added = trustStore_->add(host, port, *key); !added)
        {
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::HostFileCheckError,
                .message = added.error(),
            });
        }
        return {};
    }

    std::expected<void, ConnectionError> SessionEstablisher::authenticate(EstablishOptions const& options)
    {
        auto const& user = options.user;
        int passwordAttempts = 0;
        for (int round = 0; round != maximumAuthenticationRounds && !backend_->isAuthenticated(); ++round)
        {
            const auto methods = backend_->authenticationMethods();
            if (backend_->isAuthenticated())
                break;

            if (methods.publicKey)
            {
                if (options.tryAgentForAuthentication && backend_->authenticateWithAgent())
                    break;
                if (options.usePublicKeyAutoAuth && backend_->authenticateWithPublicKeyAuto())
                    break;
            }

            if (methods.password)
            {
                while (passwordAttempts < maximumPasswordAttempts)
                {
                    ++passwordAttempts;
                    const auto password = prompter_->askPassword(fmt::format("{}'s password: ", user));
                    if (!password)
                        continue;
                    if (backend_->authenticateWithPassword(*password))
                        break;
                    Log::info("SessionEstablisher: Password rejected for '{}'.", user);
                }
                if (backend_->isAuthenticated())
                    break;
            }

            if (!methods.publicKey && !methods.password)
                Log::warn("SessionEstablisher: Server offers no supported authentication method for '{}'.", user);
            else if (methods.keyboardInteractive || methods.hostBased || methods.gssapi)
                Log::debug("SessionEstablisher: Skipping unsupported authentication methods.");
        }

        if (!backend_->isAuthenticated())
        {
            Log::error("SessionEstablisher: Unable to authenticate '{}'.", user);
            return std::unexpected(ConnectionError{
                .type = ConnectionErrorType::UserAuthenticationError,
                .message = fmt::format("Unable to authenticate session for user {}.", user),
            });
        }
        Log::info("SessionEstablisher: Authenticated as '{}'.", user);
        return {};
    }
}
