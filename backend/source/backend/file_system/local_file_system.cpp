#include <backend/file_system/local_file_system.hpp>
#include <log/log.hpp>

#include <chrono>
#include <fstream>
#include <system_error>

namespace
{
    SharedData::FileType fileTypeOf(std::filesystem::file_status const& status)
    {
        using enum SharedData::FileType;
        switch (status.type())
        {
            case std::filesystem::file_type::regular:
                return Regular;
            case std::filesystem::file_type::directory:
                return Directory;
            case std::filesystem::file_type::symlink:
                return Symlink;
            case std::filesystem::file_type::block:
                return BlockDevice;
            case std::filesystem::file_type::character:
                return CharDevice;
            case std::filesystem::file_type::fifo:
                return Fifo;
            case std::filesystem::file_type::socket:
                return Socket;
            default:
                return Unknown;
        }
    }

    class LocalReadStream : public IReadStream
    {
      public:
        LocalReadStream(std::filesystem::path path, std::ifstream stream)
            : path_{std::move(path)}
            , stream_{std::move(stream)}
        {}

        std::expected<std::size_t, Error> read(std::span<char> buffer) override
        {
            stream_.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (stream_.bad())
            {
                return std::unexpected(Error{
                    .type = SharedData::FileSystemErrorType::ReadFailure,
                    .path = path_,
                    .message = "Stream is in a bad state.",
                });
            }
            return static_cast<std::size_t>(stream_.gcount());
        }

      private:
        std::filesystem::path path_;
        std::ifstream stream_;
    };

    class LocalWriteStream : public IWriteStream
    {
      public:
        LocalWriteStream(std::filesystem::path path, std::ofstream stream)
            : path_{std::move(path)}
            , stream_{std::move(stream)}
        {}

        std::expected<void, Error> write(std::span<char const> data) override
        {
            if (!stream_.is_open())
                return std::unexpected(
                    Error{.type = SharedData::FileSystemErrorType::WriteFailure, .path = path_, .message = "Closed."});

            stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!stream_.good())
            {
                return std::unexpected(Error{
                    .type = SharedData::FileSystemErrorType::WriteFailure,
                    .path = path_,
                    .message = "Stream is in a bad state.",
                });
            }
            return {};
        }

        std::expected<void, Error> close() override
        {
            if (!stream_.is_open())
                return {};
            stream_.close();
            if (stream_.fail())
            {
                return std::unexpected(Error{
                    .type = SharedData::FileSystemErrorType::CloseFailure,
                    .path = path_,
                    .message = "Failed to flush and close file.",
                });
            }
            return {};
        }

      private:
        std::filesystem::path path_;
        std::ofstream stream_;
    };
}

SharedData::FileInformation Detail::fileInformationOf(std::filesystem::directory_entry const& entry)
{
    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec)
    {
        Log::warn("LocalFileSystem: Cannot stat '{}': {}", entry.path().generic_string(), ec.message());
        ec.clear();
    }

    SharedData::FileInformation information{
        .path = entry.path().filename(),
        .type = fileTypeOf(status),
        .size = 0,
        .permissions = status.permissions(),
        .mtime = 0,
    };
    if (status.type() == std::filesystem::file_type::regular)
    {
        const auto size = entry.file_size(ec);
        information.size = ec ? 0 : size;
        ec.clear();
    }
    const auto writeTime = entry.last_write_time(ec);
    if (!ec)
    {
        information.mtime = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::file_clock::to_sys(writeTime).time_since_epoch())
                .count());
    }
    return information;
}

std::expected<std::vector<SharedData::FileInformation>, LocalFileSystem::Error>
LocalFileSystem::list(std::filesystem::path const& path)
{
    std::error_code ec;
    auto iterator = std::filesystem::directory_iterator{path, ec};
    if (ec)
    {
        Log::error("LocalFileSystem: Cannot list '{}': {}", path.generic_string(), ec.message());
        return std::unexpected(Error{
            .type = ec == std::errc::no_such_file_or_directory ? ErrorType::NotFound : ErrorType::ListFailure,
            .path = path,
            .message = ec.message(),
        });
    }

    return Detail::readDirectory(std::move(iterator), path);
}

std::expected<bool, LocalFileSystem::Error> LocalFileSystem::exists(std::filesystem::path const& path)
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        return std::unexpected(Error{.type = ErrorType::StatFailure, .path = path, .message = ec.message()});
    return std::filesystem::exists(status);
}

std::expected<void, LocalFileSystem::Error> LocalFileSystem::createDirectory(std::filesystem::path const& path)
{
    std::error_code ec;
    const bool created = std::filesystem::create_directory(path, ec);
    if (ec)
        return std::unexpected(Error{.type = ErrorType::CreateDirectoryFailure, .path = path, .message = ec.message()});
    if (!created)
    {
        return std::unexpected(
            Error{.type = ErrorType::CreateDirectoryFailure, .path = path, .message = "Directory already exists."});
    }
    return {};
}

std::expected<std::unique_ptr<IReadStream>, LocalFileSystem::Error>
LocalFileSystem::openForRead(std::filesystem::path const& path)
{
    std::ifstream stream{path, std::ios_base::binary};
    if (!stream.is_open())
    {
        Log::error("LocalFileSystem: Cannot open '{}' for reading.", path.generic_string());
        return std::unexpected(
            Error{.type = ErrorType::OpenFailure, .path = path, .message = "Cannot open file for reading."});
    }
    return std::make_unique<LocalReadStream>(path, std::move(stream));
}

std::expected<std::unique_ptr<IWriteStream>, LocalFileSystem::Error>
LocalFileSystem::openForWrite(std::filesystem::path const& path)
{
    std::ofstream stream{path, std::ios_base::binary | std::ios_base::trunc};
    if (!stream.is_open())
    {
        Log::error("LocalFileSystem: Cannot open '{}' for writing.", path.generic_string());
        return std::unexpected(
            Error{.type = ErrorType::OpenFailure, .path = path, .message = "Cannot open file for writing."});
    }
    return std::make_unique<LocalWriteStream>(path, std::move(stream));
}
