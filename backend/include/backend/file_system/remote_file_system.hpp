#pragma once

#include <backend/file_system/file_system.hpp>
#include <log/log.hpp>
#include <ssh/sftp_session.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <type_traits>

/**
 * @brief The filesystem of the server, reached through an sftp session.
 * All operations block the calling thread until the processing thread of the session answered, at most futureTimeout.
 */
class RemoteFileSystem : public IFileSystem
{
  public:
    RemoteFileSystem(std::weak_ptr<SecureShell::SftpSession> sftp, std::chrono::seconds futureTimeout);

    std::expected<std::vector<SharedData::FileInformation>, Error> list(std::filesystem::path const& path) override;
    std::expected<bool, Error> exists(std::filesystem::path const& path) override;
    std::expected<void, Error> createDirectory(std::filesystem::path const& path) override;
    std::expected<std::unique_ptr<IReadStream>, Error> openForRead(std::filesystem::path const& path) override;
    std::expected<std::unique_ptr<IWriteStream>, Error> openForWrite(std::filesystem::path const& path) override;

    /**
     * @brief The directory the server starts the user in.
     */
    std::expected<std::filesystem::path, Error> homeDirectory();

    template <typename T>
    static std::expected<T, Error> awaitFuture(
        std::future<std::expected<T, SecureShell::SftpError>> future,
        std::chrono::seconds timeout,
        std::filesystem::path const& path,
        SharedData::FileSystemErrorType failureType)
    {
        if (future.wait_for(timeout) != std::future_status::ready)
        {
            Log::error("RemoteFileSystem: Future timed out for '{}'.", path.generic_string());
            return std::unexpected(Error{
                .type = SharedData::FileSystemErrorType::FutureTimeout,
                .path = path,
                .message = "The server did not answer in time.",
            });
        }

        try
        {
            auto result = future.get();
            if (!result.has_value())
            {
                return std::unexpected(Error{
                    .type = failureType,
                    .path = path,
                    .message = result.error().message,
                    .sftpError = result.error(),
                });
            }
            if constexpr (std::is_void_v<T>)
                return {};
            else
                return std::move(result).value();
        }
        catch (std::future_error const& exc)
        {
            Log::error("RemoteFileSystem: Session went away during an operation on '{}': {}", path.generic_string(), exc.what());
            return std::unexpected(Error{
                .type = SharedData::FileSystemErrorType::SessionExpired,
                .path = path,
                .message = "The sftp session is closed.",
            });
        }
    }

  private:
    std::expected<std::shared_ptr<SecureShell::SftpSession>, Error> lockSession(std::filesystem::path const& path) const;

  private:
    std::weak_ptr<SecureShell::SftpSession> sftp_;
    std::chrono::seconds futureTimeout_;
};
