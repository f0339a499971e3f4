#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace SharedData
{
    enum class FileType : std::uint8_t
    {
        Unknown = 0,
        Regular = 1,
        Directory = 2,
        Symlink = 3,
        Special = 4,
        Socket = 5,
        CharDevice = 6,
        BlockDevice = 7,
        Fifo = 8
    };

    /**
     * @brief One raw record of a directory listing, as reported by either the local filesystem or the sftp server.
     */
    struct FileInformation
    {
        using FileType = SharedData::FileType;

        /// Name of the file relative to the listed directory.
        std::filesystem::path path{};
        FileType type{FileType::Unknown};
        std::uint64_t size{0};
        std::filesystem::perms permissions{std::filesystem::perms::unknown};
        std::uint64_t mtime{0};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }
        bool isDotOrDotDot() const
        {
            return path == "." || path == "..";
        }
    };
}
