#include <shared_data/transfer_error.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

namespace SharedData
{
    std::string TransferError::toString() const
    {
        const auto name = path.filename().string();
        std::string description;
        switch (type)
        {
            case TransferErrorType::LocalFileExists:
                description = fmt::format("Local file \"{}\" already exists.", name);
                break;
            case TransferErrorType::RemoteFileExists:
                description = fmt::format("Remote file \"{}\" already exists.", name);
                break;
            case TransferErrorType::CannotUploadParent:
                description = "Cannot upload the parent directory.";
                break;
            case TransferErrorType::CannotDownloadParent:
                description = "Cannot download the parent directory.";
                break;
            default:
                description = fmt::format("{} \"{}\".", Utility::enumToString(type), path.generic_string());
                break;
        }
        if (cause)
            return fmt::format("{} {}", description, cause->toString());
        return description;
    }
}
