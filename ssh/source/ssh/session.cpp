#include <ssh/session.hpp>
#include <ssh/sequential.hpp>
#include <ssh/sftp_session.hpp>
#include <log/log.hpp>

#include <fmt/format.h>
#include <libssh/sftp.h>

#include <algorithm>
#include <array>

namespace SecureShell
{
    Session::Session()
        : processingThread_{}
        , session_{}
        , connected_{false}
        , connectedPort_{22}
        , authenticated_{false}
        , noneAuthenticationAttempted_{false}
        , sftpSessions_{}
    {}

    Session::~Session()
    {
        shutdown();
    }

    void Session::start()
    {
        processingThread_.start(std::chrono::milliseconds{100});
    }

    void Session::shutdown()
    {
        processingThread_.pushTask([this]() {
            auto sessions = std::move(sftpSessions_);
            for (auto& sftp : sessions)
                sftp->close();
            if (connected_)
            {
                session_.disconnect();
                connected_ = false;
            }
        });
        processingThread_.stop();
    }

    std::expected<void, std::string> Session::connect(
        std::string const& host,
        std::optional<std::uint16_t> port,
        std::string const& user,
        TransportOptions const& options)
    {
        if (connected_)
        {
            session_.disconnect();
            connected_ = false;
        }

        auto result = Detail::sequential(
            [&] {
                return session_.setOption(SSH_OPTIONS_HOST, host.c_str());
            },
            [&] {
                return session_.setOption(SSH_OPTIONS_USER, user.c_str());
            },
            [&] {
                if (!port)
                    return 0;
                unsigned int portValue = *port;
                return session_.setOption(SSH_OPTIONS_PORT, &portValue);
            },
            [&] {
                long timeout = static_cast<long>(options.timeout.count());
                return session_.setOption(SSH_OPTIONS_TIMEOUT, timeout);
            },
            [&] {
                return session_.setOption(SSH_OPTIONS_COMPRESSION, options.compression ? "yes" : "no");
            },
            [&] {
                // Host trust is decided by the caller against its own trust store.
                int strict = 0;
                return session_.setOption(SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
            },
            [&] {
                return session_.connect();
            });

        if (!result.success())
        {
            std::string message = session_.getError();
            session_.disconnect();
            return std::unexpected(std::move(message));
        }
        connected_ = true;
        unsigned int resolvedPort = 22;
        if (ssh_options_get_port(session_.getCSession(), &resolvedPort) == SSH_OK)
            connectedPort_ = static_cast<std::uint16_t>(resolvedPort);
        noneAuthenticationAttempted_ = false;
        authenticated_ = false;
        return {};
    }

    std::uint16_t Session::connectedPort() const
    {
        return connectedPort_;
    }

    std::expected<HostKey, std::string> Session::serverHostKey()
    {
        ssh_key rawKey = nullptr;
        if (ssh_get_server_publickey(session_.getCSession(), &rawKey) != SSH_OK || rawKey == nullptr)
            return std::unexpected(fmt::format("Unable to get the host key: {}", session_.getError()));
        std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> key{rawKey, ssh_key_free};

        char* base64 = nullptr;
        if (ssh_pki_export_pubkey_base64(key.get(), &base64) != SSH_OK || base64 == nullptr)
            return std::unexpected(std::string{"Unable to export the host key."});

        char const* keyType = ssh_key_type_to_char(ssh_key_type(key.get()));
        if (keyType == nullptr)
        {
            ssh_string_free_char(base64);
            return std::unexpected(std::string{"Unknown host key type."});
        }

        HostKey hostKey{
            .type = keyType,
            .base64 = base64,
            .fingerprint = std::nullopt,
        };
        ssh_string_free_char(base64);

        constexpr std::array hashTypes{SSH_PUBLICKEY_HASH_SHA256, SSH_PUBLICKEY_HASH_SHA1};
        for (auto hashType : hashTypes)
        {
            unsigned char* hash = nullptr;
            std::size_t hashLength = 0;
            if (ssh_get_publickey_hash(key.get(), hashType, &hash, &hashLength) != SSH_OK)
                continue;

            char* fingerprint = ssh_get_fingerprint_hash(hashType, hash, hashLength);
            ssh_clean_pubkey_hash(&hash);
            if (fingerprint != nullptr)
            {
                hostKey.fingerprint = fingerprint;
                ssh_string_free_char(fingerprint);
                break;
            }
        }
        return hostKey;
    }

    AuthenticationMethods Session::authenticationMethods()
    {
        // The server only tells its methods after an attempt, "none" is that attempt.
        if (!noneAuthenticationAttempted_)
        {
            noneAuthenticationAttempted_ = true;
            if (ssh_userauth_none(session_.getCSession(), nullptr) == SSH_AUTH_SUCCESS)
            {
                authenticated_ = true;
                return {};
            }
        }

        const int methods = ssh_userauth_list(session_.getCSession(), nullptr);
        return AuthenticationMethods{
            .publicKey = (methods & SSH_AUTH_METHOD_PUBLICKEY) != 0,
            .password = (methods & SSH_AUTH_METHOD_PASSWORD) != 0,
            .keyboardInteractive = (methods & SSH_AUTH_METHOD_INTERACTIVE) != 0,
            .hostBased = (methods & SSH_AUTH_METHOD_HOSTBASED) != 0,
            .gssapi = (methods & SSH_AUTH_METHOD_GSSAPI_MIC) != 0,
        };
    }

    bool Session::authenticateWithAgent()
    {
        const auto result = ssh_userauth_agent(session_.getCSession(), nullptr);
        if (result != SSH_AUTH_SUCCESS)
        {
            Log::debug("Session: Agent authentication failed: {}", session_.getError());
            return false;
        }
        authenticated_ = true;
        return true;
    }

    bool Session::authenticateWithPublicKeyAuto()
    {
        const auto result = session_.userauthPublickeyAuto();
        if (result != SSH_AUTH_SUCCESS)
        {
            Log::debug("Session: Public key authentication failed: {}", session_.getError());
            return false;
        }
        authenticated_ = true;
        return true;
    }

    bool Session::authenticateWithPassword(std::string const& password)
    {
        const auto result = session_.userauthPassword(password.c_str());
        if (result != SSH_AUTH_SUCCESS)
            return false;
        authenticated_ = true;
        return true;
    }

    bool Session::isAuthenticated() const
    {
        return authenticated_;
    }

    std::future<std::expected<std::weak_ptr<SftpSession>, SftpError>> Session::createSftpSession()
    {
        return performPromise([this]() -> std::expected<std::weak_ptr<SftpSession>, SftpError> {
            auto sftp = sftp_new(session_.getCSession());
            if (sftp == nullptr)
            {
                return std::unexpected(SftpError{
                    .message = ssh_get_error(session_.getCSession()),
                    .sshError = ssh_get_error_code(session_.getCSession()),
                    .sftpError = 0,
                });
            }

            const auto result = sftp_init(sftp);
            if (result != SSH_OK)
            {
                SftpError error{
                    .message = ssh_get_error(session_.getCSession()),
                    .sshError = result,
                    .sftpError = sftp_get_error(sftp),
                };
                sftp_free(sftp);
                return std::unexpected(std::move(error));
            }

            auto sftpSession = std::make_shared<SftpSession>(this, sftp);
            sftpSessions_.push_back(sftpSession);
            return std::weak_ptr<SftpSession>{sftpSession};
        });
    }

    std::expected<std::unique_ptr<Session>, ConnectionError>
    makeSession(EstablishOptions const& options, ITrustStore& trustStore, IUserPrompter& prompter)
    {
        auto session = std::make_unique<Session>();

        SessionEstablisher establisher{*session, trustStore, prompter};
        if (auto result = establisher.establish(options); !result)
            return std::unexpected(result.error());

        session->start();
        return session;
    }
}
