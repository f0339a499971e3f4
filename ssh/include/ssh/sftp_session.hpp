#pragma once

#include <ssh/file_information.hpp>
#include <ssh/file_stream.hpp>
#include <ssh/sftp_error.hpp>

#include <libssh/libsshpp.hpp>
#include <libssh/sftp.h>

#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <fcntl.h>

namespace SecureShell
{
    class Session;

    class SftpSession : public std::enable_shared_from_this<SftpSession>
    {
      public:
        using Error = SftpError;
        friend class FileStream;

        SftpSession(Session* owner, sftp_session session);
        ~SftpSession();
        SftpSession(SftpSession const&) = delete;
        SftpSession& operator=(SftpSession const&) = delete;
        SftpSession(SftpSession&&) = delete;
        SftpSession& operator=(SftpSession&&) = delete;

        /**
         * @brief Closes all open files and the sftp subsystem. Must run on the processing thread.
         */
        void close();

        template <typename FunctionT>
        auto performPromise(FunctionT&& func);

        /**
         * @brief Retrieves the last error that occurred. May contain success.
         */
        SftpError lastError() const;

        /**
         * @brief Lists the contents of a directory, including "." and "..".
         */
        std::future<std::expected<std::vector<FileInformation>, Error>>
        listDirectory(std::filesystem::path const& path);

        std::future<std::expected<void, Error>> createDirectory(
            std::filesystem::path const& path,
            std::filesystem::perms permissions = std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
                std::filesystem::perms::others_exec);

        /**
         * @brief True if anything exists at the path. A dangling symlink exists.
         */
        std::future<std::expected<bool, Error>> exists(std::filesystem::path const& path);

        /**
         * @brief Resolves the path on the server. "." resolves to the home directory of the user.
         */
        std::future<std::expected<std::filesystem::path, Error>> canonicalize(std::filesystem::path const& path);

        enum class OpenType : int
        {
            Read = O_RDONLY,
            Write = O_WRONLY,
            ReadWrite = O_RDWR,
            Create = O_CREAT,
            Truncate = O_TRUNC,
            Exclusive = O_EXCL,
        };

        std::future<std::expected<std::weak_ptr<FileStream>, Error>>
        openFile(std::filesystem::path const& path, OpenType openType, std::filesystem::perms permissions);

      private:
        void fileStreamRemoveItself(FileStream* stream);

      private:
        Session* owner_;
        sftp_session session_;
        std::vector<std::shared_ptr<FileStream>> fileStreams_;
    };

    inline SftpSession::OpenType operator|(SftpSession::OpenType lhs, SftpSession::OpenType rhs)
    {
        return static_cast<SftpSession::OpenType>(static_cast<int>(lhs) | static_cast<int>(rhs));
    }
}

#include <ssh/session.hpp>

namespace SecureShell
{
    template <typename FunctionT>
    auto SftpSession::performPromise(FunctionT&& func)
    {
        return owner_->performPromise(std::forward<FunctionT>(func));
    }
}
