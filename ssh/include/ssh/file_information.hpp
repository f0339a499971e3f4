#pragma once

#include <shared_data/file_information.hpp>

#include <libssh/sftp.h>

namespace SecureShell
{
    using FileInformation = SharedData::FileInformation;

    /**
     * @brief Copies name, type, size, permissions and mtime. The attributes stay owned by the caller.
     */
    FileInformation fromSftpAttributes(sftp_attributes attributes);
}
