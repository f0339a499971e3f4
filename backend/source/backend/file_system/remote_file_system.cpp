#include <backend/file_system/remote_file_system.hpp>
#include <log/log.hpp>

#include <cstring>

namespace
{
    using SharedData::FileSystemError;
    using SharedData::FileSystemErrorType;

    std::expected<std::shared_ptr<SecureShell::FileStream>, FileSystemError>
    lockStream(std::weak_ptr<SecureShell::FileStream> const& stream, std::filesystem::path const& path)
    {
        if (auto locked = stream.lock(); locked)
            return locked;
        return std::unexpected(FileSystemError{
            .type = FileSystemErrorType::SessionExpired,
            .path = path,
            .message = "The remote file was closed.",
        });
    }

    class RemoteReadStream : public IReadStream
    {
      public:
        RemoteReadStream(std::filesystem::path path, std::weak_ptr<SecureShell::FileStream> stream, std::chrono::seconds timeout)
            : path_{std::move(path)}
            , stream_{std::move(stream)}
            , futureTimeout_{timeout}
        {}
        ~RemoteReadStream() override
        {
            auto stream = stream_.lock();
            if (!stream)
                return;
            const auto result = RemoteFileSystem::awaitFuture(
                stream->close(), futureTimeout_, path_, FileSystemErrorType::CloseFailure);
            if (!result.has_value())
                Log::warn("RemoteReadStream: Failed to close '{}': {}", path_.generic_string(), result.error().toString());
        }
        RemoteReadStream(RemoteReadStream const&) = delete;
        RemoteReadStream& operator=(RemoteReadStream const&) = delete;
        RemoteReadStream(RemoteReadStream&&) = delete;
        RemoteReadStream& operator=(RemoteReadStream&&) = delete;

        std::expected<std::size_t, Error> read(std::span<char> buffer) override
        {
            auto stream = lockStream(stream_, path_);
            if (!stream.has_value())
                return std::unexpected(stream.error());

            // A single sftp read is capped at the server limit, so fill the buffer with several.
            std::size_t total = 0;
            while (total < buffer.size())
            {
                auto chunk = RemoteFileSystem::awaitFuture(
                    (*stream)->read(buffer.size() - total), futureTimeout_, path_, FileSystemErrorType::ReadFailure);
                if (!chunk.has_value())
                    return std::unexpected(chunk.error());
                if (chunk->empty())
                    break;
                std::memcpy(buffer.data() + total, chunk->data(), chunk->size());
                total += chunk->size();
            }
            return total;
        }

      private:
        std::filesystem::path path_;
        std::weak_ptr<SecureShell::FileStream> stream_;
        std::chrono::seconds futureTimeout_;
    };

    class RemoteWriteStream : public IWriteStream
    {
      public:
        RemoteWriteStream(std::filesystem::path path, std::weak_ptr<SecureShell::FileStream> stream, std::chrono::seconds timeout)
            : path_{std::move(path)}
            , stream_{std::move(stream)}
            , futureTimeout_{timeout}
            , closed_{false}
        {}
        ~RemoteWriteStream() override
        {
            if (closed_)
                return;
            const auto result = close();
            if (!result.has_value())
                Log::warn("RemoteWriteStream: Failed to close '{}': {}", path_.generic_string(), result.error().toString());
        }
        RemoteWriteStream(RemoteWriteStream const&) = delete;
        RemoteWriteStream& operator=(RemoteWriteStream const&) = delete;
        RemoteWriteStream(RemoteWriteStream&&) = delete;
        RemoteWriteStream& operator=(RemoteWriteStream&&) = delete;

        std::expected<void, Error> write(std::span<char const> data) override
        {
            if (closed_)
                return std::unexpected(Error{.type = FileSystemErrorType::WriteFailure, .path = path_, .message = "Closed."});

            auto stream = lockStream(stream_, path_);
            if (!stream.has_value())
                return std::unexpected(stream.error());

            return RemoteFileSystem::awaitFuture(
                (*stream)->write(std::string{data.data(), data.size()}),
                futureTimeout_,
                path_,
                FileSystemErrorType::WriteFailure);
        }

        std::expected<void, Error> close() override
        {
            if (closed_)
                return {};
            closed_ = true;

            auto stream = lockStream(stream_, path_);
            if (!stream.has_value())
                return std::unexpected(stream.error());
            return RemoteFileSystem::awaitFuture(
                (*stream)->close(), futureTimeout_, path_, FileSystemErrorType::CloseFailure);
        }

      private:
        std::filesystem::path path_;
        std::weak_ptr<SecureShell::FileStream> stream_;
        std::chrono::seconds futureTimeout_;
        bool closed_;
    };
}

RemoteFileSystem::RemoteFileSystem(std::weak_ptr<SecureShell::SftpSession> sftp, std::chrono::seconds futureTimeout)
    : sftp_{std::move(sftp)}
    , futureTimeout_{futureTimeout}
{}

std::expected<std::shared_ptr<SecureShell::SftpSession>, RemoteFileSystem::Error>
RemoteFileSystem::lockSession(std::filesystem::path const& path) const
{
    if (auto sftp = sftp_.lock(); sftp)
        return sftp;
    Log::error("RemoteFileSystem: Sftp session expired.");
    return std::unexpected(
        Error{.type = ErrorType::SessionExpired, .path = path, .message = "The sftp session is closed."});
}

std::expected<std::vector<SharedData::FileInformation>, RemoteFileSystem::Error>
RemoteFileSystem::list(std::filesystem::path const& path)
{
    return lockSession(path).and_then([&](auto const& sftp) {
        return awaitFuture(sftp->listDirectory(path), futureTimeout_, path, ErrorType::ListFailure);
    });
}

std::expected<bool, RemoteFileSystem::Error> RemoteFileSystem::exists(std::filesystem::path const& path)
{
    return lockSession(path).and_then([&](auto const& sftp) {
        return awaitFuture(sftp->exists(path), futureTimeout_, path, ErrorType::StatFailure);
    });
}

std::expected<void, RemoteFileSystem::Error> RemoteFileSystem::createDirectory(std::filesystem::path const& path)
{
    return lockSession(path).and_then([&](auto const& sftp) {
        return awaitFuture(sftp->createDirectory(path), futureTimeout_, path, ErrorType::CreateDirectoryFailure);
    });
}

std::expected<std::unique_ptr<IReadStream>, RemoteFileSystem::Error>
RemoteFileSystem::openForRead(std::filesystem::path const& path)
{
    using OpenType = SecureShell::SftpSession::OpenType;

    auto sftp = lockSession(path);
    if (!sftp.has_value())
        return std::unexpected(sftp.error());

    auto stream = awaitFuture(
        (*sftp)->openFile(path, OpenType::Read, std::filesystem::perms::none),
        futureTimeout_,
        path,
        ErrorType::OpenFailure);
    if (!stream.has_value())
        return std::unexpected(stream.error());

    return std::make_unique<RemoteReadStream>(path, std::move(stream).value(), futureTimeout_);
}

std::expected<std::unique_ptr<IWriteStream>, RemoteFileSystem::Error>
RemoteFileSystem::openForWrite(std::filesystem::path const& path)
{
    using OpenType = SecureShell::SftpSession::OpenType;
    using std::filesystem::perms;

    auto sftp = lockSession(path);
    if (!sftp.has_value())
        return std::unexpected(sftp.error());

    auto stream = awaitFuture(
        (*sftp)->openFile(
            path,
            OpenType::Write | OpenType::Create | OpenType::Truncate,
            perms::owner_read | perms::owner_write | perms::group_read | perms::others_read),
        futureTimeout_,
        path,
        ErrorType::OpenFailure);
    if (!stream.has_value())
        return std::unexpected(stream.error());

    return std::make_unique<RemoteWriteStream>(path, std::move(stream).value(), futureTimeout_);
}

std::expected<std::filesystem::path, RemoteFileSystem::Error> RemoteFileSystem::homeDirectory()
{
    return lockSession(".").and_then([&](auto const& sftp) {
        return awaitFuture(sftp->canonicalize("."), futureTimeout_, ".", ErrorType::CanonicalizeFailure);
    });
}
