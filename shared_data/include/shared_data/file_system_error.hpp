#pragma once

#include <ssh/sftp_error.hpp>

#include <boost/describe/enum.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        FileSystemErrorType,
        NotFound,
        ListFailure,
        StatFailure,
        OpenFailure,
        ReadFailure,
        WriteFailure,
        CloseFailure,
        CreateDirectoryFailure,
        CanonicalizeFailure,
        FutureTimeout,
        SessionExpired);

    /**
     * @brief A failed primitive of the local or the remote filesystem.
     */
    struct FileSystemError
    {
        FileSystemErrorType type;
        std::filesystem::path path{};
        std::string message{};
        std::optional<SecureShell::SftpError> sftpError = std::nullopt;

        std::string toString() const;
    };
}
