#pragma once

#include <ssh/sftp_error.hpp>

#include <libssh/sftp.h>

#include <cstddef>
#include <expected>
#include <future>
#include <memory>
#include <string>
#include <string_view>

namespace SecureShell
{
    class SftpSession;

    /**
     * @brief An open remote file. Owned by its sftp session, handed out as weak_ptr.
     */
    class FileStream : public std::enable_shared_from_this<FileStream>
    {
      public:
        constexpr static std::size_t defaultLengthLimit = 32 * 1024;

        FileStream(std::shared_ptr<SftpSession> sftp, sftp_file file, sftp_limits_struct limits);
        ~FileStream();
        FileStream(FileStream const&) = delete;
        FileStream& operator=(FileStream const&) = delete;
        FileStream(FileStream&&) = delete;
        FileStream& operator=(FileStream&&) = delete;

        /**
         * @brief Reads at most maxBytes, but never more than the read limit of the server.
         *
         * @return The data read, empty at the end of the file.
         */
        std::future<std::expected<std::string, SftpError>> read(std::size_t maxBytes);

        /**
         * @brief Writes all of data. Data larger than the write limit is broken into several writes.
         */
        std::future<std::expected<void, SftpError>> write(std::string data);

        /**
         * @brief Closes the file and removes itself from the sftp session.
         */
        std::future<std::expected<void, SftpError>> close();

        std::size_t readLengthLimit() const;
        std::size_t writeLengthLimit() const;

      private:
        friend class SftpSession;

        /**
         * @brief Closes the file right away. Must be called on the processing thread.
         */
        int closeNow();

        SftpError lastError() const;

      private:
        std::weak_ptr<SftpSession> sftp_;
        sftp_file file_;
        sftp_limits_struct limits_;
    };
}
