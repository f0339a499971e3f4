#pragma once

#include <backend/file_system/file_system.hpp>

#include <gmock/gmock.h>

namespace Test
{
    class FileSystemMock : public IFileSystem
    {
      public:
        MOCK_METHOD(
            (std::expected<std::vector<SharedData::FileInformation>, Error>),
            list,
            (std::filesystem::path const&),
            (override));
        MOCK_METHOD((std::expected<bool, Error>), exists, (std::filesystem::path const&), (override));
        MOCK_METHOD((std::expected<void, Error>), createDirectory, (std::filesystem::path const&), (override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<IReadStream>, Error>),
            openForRead,
            (std::filesystem::path const&),
            (override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<IWriteStream>, Error>),
            openForWrite,
            (std::filesystem::path const&),
            (override));
    };
}
