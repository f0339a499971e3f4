#pragma once

#include <backend/file_system/file_system.hpp>
#include <log/log.hpp>

#include <system_error>

class LocalFileSystem : public IFileSystem
{
  public:
    std::expected<std::vector<SharedData::FileInformation>, Error> list(std::filesystem::path const& path) override;
    std::expected<bool, Error> exists(std::filesystem::path const& path) override;
    std::expected<void, Error> createDirectory(std::filesystem::path const& path) override;
    std::expected<std::unique_ptr<IReadStream>, Error> openForRead(std::filesystem::path const& path) override;
    std::expected<std::unique_ptr<IWriteStream>, Error> openForWrite(std::filesystem::path const& path) override;
};

namespace Detail
{
    SharedData::FileInformation fileInformationOf(std::filesystem::directory_entry const& entry);

    /**
     * @brief Drains an open directory iterator. An error while advancing ends the listing with ListFailure.
     * A default constructed DirectoryIteratorT is the end iterator.
     */
    template <typename DirectoryIteratorT>
    std::expected<std::vector<SharedData::FileInformation>, SharedData::FileSystemError>
    readDirectory(DirectoryIteratorT iterator, std::filesystem::path const& path)
    {
        std::vector<SharedData::FileInformation> result;
        std::error_code ec;
        while (iterator != DirectoryIteratorT{})
        {
            result.push_back(fileInformationOf(*iterator));
            iterator.increment(ec);
            if (ec)
            {
                Log::error("LocalFileSystem: Listing '{}' failed midway: {}", path.generic_string(), ec.message());
                return std::unexpected(SharedData::FileSystemError{
                    .type = SharedData::FileSystemErrorType::ListFailure,
                    .path = path,
                    .message = ec.message(),
                });
            }
        }
        return result;
    }
}
