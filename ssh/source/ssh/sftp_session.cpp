#include <ssh/sftp_session.hpp>
#include <ssh/session.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <functional>

namespace SecureShell
{
    SftpSession::SftpSession(Session* owner, sftp_session session)
        : owner_{owner}
        , session_{session}
        , fileStreams_{}
    {}

    SftpSession::~SftpSession()
    {
        if (session_ != nullptr)
            sftp_free(session_);
    }

    void SftpSession::close()
    {
        auto streams = std::move(fileStreams_);
        for (auto& stream : streams)
            stream->closeNow();
        if (session_ != nullptr)
        {
            sftp_free(session_);
            session_ = nullptr;
        }
    }

    void SftpSession::fileStreamRemoveItself(FileStream* stream)
    {
        fileStreams_.erase(
            std::remove_if(
                fileStreams_.begin(),
                fileStreams_.end(),
                [stream](auto const& item) {
                    return item.get() == stream;
                }),
            fileStreams_.end());
    }

    SftpError SftpSession::lastError() const
    {
        if (session_ == nullptr)
            return SftpError{.message = "Sftp session is closed.", .wrapperError = WrapperErrors::OwnerNull};

        return SftpError{
            .message = ssh_get_error(owner_->session_.getCSession()),
            .sshError = ssh_get_error_code(owner_->session_.getCSession()),
            .sftpError = sftp_get_error(session_),
        };
    }

    std::future<std::expected<std::vector<FileInformation>, SftpSession::Error>>
    SftpSession::listDirectory(std::filesystem::path const& path)
    {
        return performPromise([self = shared_from_this(), path]() -> std::expected<std::vector<FileInformation>, Error> {
            if (self->session_ == nullptr)
                return std::unexpected(self->lastError());

            int closeResult = SSH_OK;
            std::vector<FileInformation> entries{};
            {
                std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                    sftp_opendir(self->session_, path.generic_string().c_str()), [&closeResult](sftp_dir_struct* dir) {
                        if (dir != nullptr)
                            closeResult = sftp_closedir(dir);
                    }};
                if (dir == nullptr)
                    return std::unexpected(self->lastError());

                std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> entry{
                    sftp_readdir(self->session_, dir.get()), sftp_attributes_free};
                for (; entry != nullptr; entry.reset(sftp_readdir(self->session_, dir.get())))
                    entries.push_back(fromSftpAttributes(entry.get()));

                if (!sftp_dir_eof(dir.get()))
                    return std::unexpected(self->lastError());
            }
            if (closeResult != SSH_OK)
                return std::unexpected(self->lastError());

            return entries;
        });
    }

    std::future<std::expected<void, SftpSession::Error>>
    SftpSession::createDirectory(std::filesystem::path const& path, std::filesystem::perms permissions)
    {
        return performPromise([self = shared_from_this(), path, permissions]() -> std::expected<void, Error> {
            if (self->session_ == nullptr)
                return std::unexpected(self->lastError());

            const auto result = sftp_mkdir(
                self->session_,
                path.generic_string().c_str(),
                static_cast<mode_t>(permissions & std::filesystem::perms::mask));
            if (result != SSH_OK)
                return std::unexpected(self->lastError());
            return {};
        });
    }

    std::future<std::expected<bool, SftpSession::Error>> SftpSession::exists(std::filesystem::path const& path)
    {
        return performPromise([self = shared_from_this(), path]() -> std::expected<bool, Error> {
            if (self->session_ == nullptr)
                return std::unexpected(self->lastError());

            std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
                sftp_lstat(self->session_, path.generic_string().c_str()), sftp_attributes_free};
            if (attributes != nullptr)
                return true;
            if (sftp_get_error(self->session_) == SSH_FX_NO_SUCH_FILE)
                return false;
            return std::unexpected(self->lastError());
        });
    }

    std::future<std::expected<std::filesystem::path, SftpSession::Error>>
    SftpSession::canonicalize(std::filesystem::path const& path)
    {
        return performPromise([self = shared_from_this(), path]() -> std::expected<std::filesystem::path, Error> {
            if (self->session_ == nullptr)
                return std::unexpected(self->lastError());

            char* resolved = sftp_canonicalize_path(self->session_, path.generic_string().c_str());
            if (resolved == nullptr)
                return std::unexpected(self->lastError());

            std::filesystem::path result{resolved};
            ssh_string_free_char(resolved);
            return result;
        });
    }

    std::future<std::expected<std::weak_ptr<FileStream>, SftpSession::Error>>
    SftpSession::openFile(std::filesystem::path const& path, OpenType openType, std::filesystem::perms permissions)
    {
        return performPromise(
            [self = shared_from_this(), path, openType, permissions]() -> std::expected<std::weak_ptr<FileStream>, Error> {
                if (self->session_ == nullptr)
                    return std::unexpected(self->lastError());

                sftp_file file = sftp_open(
                    self->session_,
                    path.generic_string().c_str(),
                    static_cast<int>(openType),
                    static_cast<mode_t>(permissions & std::filesystem::perms::mask));
                if (file == nullptr)
                    return std::unexpected(self->lastError());

                sftp_limits_struct limits{};
                if (sftp_limits_t serverLimits = sftp_limits(self->session_); serverLimits != nullptr)
                {
                    limits = *serverLimits;
                    sftp_limits_free(serverLimits);
                }
                else
                {
                    Log::debug("SftpSession: Server reports no limits, using defaults.");
                }

                auto stream = std::make_shared<FileStream>(self, file, limits);
                self->fileStreams_.push_back(stream);
                return std::weak_ptr<FileStream>{stream};
            });
    }
}
