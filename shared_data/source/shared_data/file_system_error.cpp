#include <shared_data/file_system_error.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

namespace SharedData
{
    std::string FileSystemError::toString() const
    {
        const auto enumString = Utility::enumToString(type);
        std::string result = path.empty() ? enumString : fmt::format("{} \"{}\"", enumString, path.generic_string());
        if (!message.empty())
            result += fmt::format(": {}", message);
        if (sftpError)
            result += fmt::format(" ({})", sftpError->toString());
        return result;
    }
}
