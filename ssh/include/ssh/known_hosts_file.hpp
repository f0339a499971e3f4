#pragma once

#include <ssh/trust_store.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace SecureShell
{
    /**
     * @brief Trust store backed by an OpenSSH known_hosts file.
     * Hashed host names and marker lines (@cert-authority, @revoked) are not understood and skipped.
     */
    class KnownHostsFile : public ITrustStore
    {
      public:
        explicit KnownHostsFile(std::filesystem::path file);

        std::expected<TrustCheckResult, std::string>
        check(std::string const& host, std::uint16_t port, HostKey const& key) override;
        std::expected<void, std::string> add(std::string const& host, std::uint16_t port, HostKey const& key) override;
        std::string location() const override;

        /**
         * @brief "host" for port 22, "[host]:port" otherwise.
         */
        static std::string hostPattern(std::string const& host, std::uint16_t port);

        /**
         * @brief ~/.ssh/known_hosts, or std::nullopt when no home directory is known.
         */
        static std::optional<std::filesystem::path> defaultLocation();

      private:
        struct Record
        {
            std::vector<std::string> patterns;
            std::string keyType;
            std::string base64;
        };

        std::expected<std::vector<Record>, std::string> readRecords() const;

      private:
        std::filesystem::path file_;
    };
}
