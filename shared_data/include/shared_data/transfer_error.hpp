#pragma once

#include <shared_data/file_system_error.hpp>

#include <boost/describe/enum.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        TransferErrorType,
        LocalFileExists,
        RemoteFileExists,
        CannotUploadParent,
        CannotDownloadParent,
        SourceFailure,
        DestinationFailure);

    struct TransferError
    {
        TransferErrorType type;
        std::filesystem::path path{};
        std::optional<FileSystemError> cause = std::nullopt;

        /**
         * @brief A single line suitable for the status queue.
         */
        std::string toString() const;
    };
}
