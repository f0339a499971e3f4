#pragma once

#include <optional>
#include <string>

namespace SecureShell
{
    /**
     * @brief Public host key as presented by a server.
     */
    struct HostKey
    {
        /// OpenSSH key type name, e.g. "ssh-ed25519".
        std::string type{};
        /// Base64 encoded key blob, as it appears in a known_hosts file.
        std::string base64{};
        /// "SHA256:..." or, if unavailable, "SHA1:...".
        std::optional<std::string> fingerprint{};
    };
}
