#pragma once

#include <utility/enum_string_convert.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <string>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(
        WrapperErrors,
        None,
        OwnerNull,
        SharedPtrDestroyed,
        // The server accepted less than was sent and then nothing at all.
        ShortWrite,
        FileNull,
        TaskRejected);

    struct SftpError
    {
        std::string message;
        int sshError = 0;
        int sftpError = 0;
        WrapperErrors wrapperError = WrapperErrors::None;

        inline std::string toString() const
        {
            if (wrapperError != WrapperErrors::None)
                return fmt::format("{} ({})", message, Utility::enumToString(wrapperError));
            return fmt::format("{} (ssh error: {}, sftp error: {})", message, sshError, sftpError);
        }
    };
}
