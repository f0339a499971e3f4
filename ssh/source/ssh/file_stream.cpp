#include <ssh/file_stream.hpp>
#include <ssh/sftp_session.hpp>

#include <algorithm>

namespace SecureShell
{
    namespace
    {
        template <typename T>
        std::future<std::expected<T, SftpError>> readyError(SftpError error)
        {
            std::promise<std::expected<T, SftpError>> promise;
            promise.set_value(std::unexpected(std::move(error)));
            return promise.get_future();
        }

        SftpError sessionExpired()
        {
            return SftpError{.message = "Sftp session is gone.", .wrapperError = WrapperErrors::SharedPtrDestroyed};
        }
    }

    FileStream::FileStream(std::shared_ptr<SftpSession> sftp, sftp_file file, sftp_limits_struct limits)
        : sftp_{sftp}
        , file_{file}
        , limits_{limits}
    {}

    FileStream::~FileStream()
    {
        closeNow();
    }

    int FileStream::closeNow()
    {
        if (file_ == nullptr)
            return SSH_OK;
        const auto result = sftp_close(file_);
        file_ = nullptr;
        return result;
    }

    SftpError FileStream::lastError() const
    {
        auto sftp = sftp_.lock();
        if (!sftp)
            return sessionExpired();
        return sftp->lastError();
    }

    std::size_t FileStream::readLengthLimit() const
    {
        return limits_.max_read_length == 0 ? defaultLengthLimit : static_cast<std::size_t>(limits_.max_read_length);
    }

    std::size_t FileStream::writeLengthLimit() const
    {
        return limits_.max_write_length == 0 ? defaultLengthLimit
                                             : static_cast<std::size_t>(limits_.max_write_length);
    }

    std::future<std::expected<std::string, SftpError>> FileStream::read(std::size_t maxBytes)
    {
        auto sftp = sftp_.lock();
        if (!sftp)
            return readyError<std::string>(sessionExpired());

        return sftp->performPromise([self = shared_from_this(), maxBytes]() -> std::expected<std::string, SftpError> {
            if (self->file_ == nullptr)
                return std::unexpected(SftpError{.message = "File is closed.", .wrapperError = WrapperErrors::FileNull});

            std::string buffer(std::min(maxBytes, self->readLengthLimit()), '\0');
            const auto amount = sftp_read(self->file_, buffer.data(), buffer.size());
            if (amount < 0)
                return std::unexpected(self->lastError());
            buffer.resize(static_cast<std::size_t>(amount));
            return buffer;
        });
    }

    std::future<std::expected<void, SftpError>> FileStream::write(std::string data)
    {
        auto sftp = sftp_.lock();
        if (!sftp)
            return readyError<void>(sessionExpired());

        return sftp->performPromise(
            [self = shared_from_this(), data = std::move(data)]() -> std::expected<void, SftpError> {
                if (self->file_ == nullptr)
                    return std::unexpected(
                        SftpError{.message = "File is closed.", .wrapperError = WrapperErrors::FileNull});

                std::string_view toWrite{data};
                while (!toWrite.empty())
                {
                    const auto written =
                        sftp_write(self->file_, toWrite.data(), std::min(toWrite.size(), self->writeLengthLimit()));
                    if (written < 0)
                        return std::unexpected(self->lastError());
                    if (written == 0)
                    {
                        return std::unexpected(SftpError{
                            .message = "Failed to write any data",
                            .wrapperError = WrapperErrors::ShortWrite,
                        });
                    }
                    toWrite.remove_prefix(static_cast<std::size_t>(written));
                }
                return {};
            });
    }

    std::future<std::expected<void, SftpError>> FileStream::close()
    {
        auto sftp = sftp_.lock();
        if (!sftp)
            return readyError<void>(sessionExpired());

        return sftp->performPromise([self = shared_from_this(), sftp]() -> std::expected<void, SftpError> {
            const auto result = self->closeNow();
            sftp->fileStreamRemoveItself(self.get());
            if (result != SSH_OK)
                return std::unexpected(sftp->lastError());
            return {};
        });
    }
}
