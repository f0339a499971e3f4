#pragma once

#include <shared_data/file_information.hpp>
#include <shared_data/file_system_error.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

class IReadStream
{
  public:
    using Error = SharedData::FileSystemError;

    virtual ~IReadStream() = default;

    /**
     * @brief Reads up to buffer.size() bytes.
     *
     * @return The amount of bytes read, 0 at the end of the file.
     */
    virtual std::expected<std::size_t, Error> read(std::span<char> buffer) = 0;
};

class IWriteStream
{
  public:
    using Error = SharedData::FileSystemError;

    virtual ~IWriteStream() = default;

    /**
     * @brief Writes all of data or fails.
     */
    virtual std::expected<void, Error> write(std::span<char const> data) = 0;

    /**
     * @brief Flushes and closes the file. Writing after close fails.
     */
    virtual std::expected<void, Error> close() = 0;
};

/**
 * @brief The primitives a transfer or a listing needs from one side, the local or the remote filesystem.
 */
class IFileSystem
{
  public:
    using Error = SharedData::FileSystemError;
    using ErrorType = SharedData::FileSystemErrorType;

    virtual ~IFileSystem() = default;

    /**
     * @brief Lists the directory. The result may contain "." and "..".
     */
    virtual std::expected<std::vector<SharedData::FileInformation>, Error> list(std::filesystem::path const& path) = 0;

    /**
     * @brief True if anything, including a dangling symlink, exists at the path.
     */
    virtual std::expected<bool, Error> exists(std::filesystem::path const& path) = 0;

    virtual std::expected<void, Error> createDirectory(std::filesystem::path const& path) = 0;

    virtual std::expected<std::unique_ptr<IReadStream>, Error> openForRead(std::filesystem::path const& path) = 0;

    /**
     * @brief Creates the file or truncates an existing one.
     */
    virtual std::expected<std::unique_ptr<IWriteStream>, Error> openForWrite(std::filesystem::path const& path) = 0;
};
