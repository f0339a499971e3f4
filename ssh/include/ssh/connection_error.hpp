#pragma once

#include <utility/enum_string_convert.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <string>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(
        ConnectionErrorType,
        InvalidPortNumber,
        TransportFailure,
        HostKeyNotFound,
        HostFingerprintNotFound,
        HostFileCheckError,
        HostAuthenticationError,
        MismatchedFingerprint,
        UserAuthenticationError,
        SftpInitFailure,
        UnableToFindHomeDirectory);

    /**
     * @brief Why a session could not be established or prepared for use.
     */
    struct ConnectionError
    {
        ConnectionErrorType type;
        std::string message{};

        std::string toString() const
        {
            if (message.empty())
                return Utility::enumToString(type);
            return fmt::format("{}: {}", Utility::enumToString(type), message);
        }
    };
}
