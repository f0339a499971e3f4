#pragma once

#include <ssh/async/processing_thread.hpp>
#include <ssh/connection_error.hpp>
#include <ssh/session_backend.hpp>
#include <ssh/session_establisher.hpp>
#include <ssh/sftp_error.hpp>
#include <ssh/trust_store.hpp>
#include <ssh/user_prompter.hpp>

#include <libssh/libsshpp.hpp>

#include <expected>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace SecureShell
{
    class SftpSession;

    /**
     * @brief An ssh session to one remote host.
     * Establishment happens on the calling thread. After start(), every use of the underlying libssh session goes
     * through the processing thread.
     */
    class Session : public ISessionBackend
    {
      public:
        friend class SftpSession;

        Session();
        ~Session() override;
        Session(Session const&) = delete;
        Session& operator=(Session const&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        std::expected<void, std::string> connect(
            std::string const& host,
            std::optional<std::uint16_t> port,
            std::string const& user,
            TransportOptions const& options) override;
        std::uint16_t connectedPort() const override;
        std::expected<HostKey, std::string> serverHostKey() override;
        AuthenticationMethods authenticationMethods() override;
        bool authenticateWithAgent() override;
        bool authenticateWithPublicKeyAuto() override;
        bool authenticateWithPassword(std::string const& password) override;
        bool isAuthenticated() const override;

        /**
         * @brief Starts the processing thread.
         */
        void start();

        /**
         * @brief Opens the sftp subsystem.
         *
         * @return std::future<std::expected<std::weak_ptr<SftpSession>, SftpError>>
         */
        std::future<std::expected<std::weak_ptr<SftpSession>, SftpError>> createSftpSession();

        template <typename FunctionT>
        auto performPromise(FunctionT&& func)
        {
            return processingThread_.pushPromiseTask(std::forward<FunctionT>(func));
        }

      private:
        /**
         * @brief Closes all sftp sessions and disconnects. The session is not usable after this.
         */
        void shutdown();

      private:
        SecureShell::ProcessingThread processingThread_;
        ssh::Session session_;
        bool connected_;
        std::uint16_t connectedPort_;
        bool authenticated_;
        bool noneAuthenticationAttempted_;
        std::vector<std::shared_ptr<SftpSession>> sftpSessions_;
    };

    /**
     * @brief Creates a session, establishes it and starts its processing thread.
     */
    std::expected<std::unique_ptr<Session>, ConnectionError>
    makeSession(EstablishOptions const& options, ITrustStore& trustStore, IUserPrompter& prompter);
}
