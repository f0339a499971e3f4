#include <backend/navigation/fetch_listing.hpp>
#include <log/log.hpp>

#include <system_error>

std::filesystem::path withoutTrailingSeparator(std::filesystem::path const& path)
{
    if (path.has_relative_path() && !path.has_filename())
        return path.parent_path();
    return path;
}

std::expected<std::filesystem::path, SharedData::FileSystemError>
canonicalLocalDirectory(std::filesystem::path const& path)
{
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec)
    {
        Log::error("Navigation: Cannot canonicalize '{}': {}", path.generic_string(), ec.message());
        return std::unexpected(SharedData::FileSystemError{
            .type = SharedData::FileSystemErrorType::CanonicalizeFailure,
            .path = path,
            .message = ec.message(),
        });
    }
    return canonical;
}
