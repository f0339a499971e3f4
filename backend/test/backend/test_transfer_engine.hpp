#pragma once

#include <backend/file_system/local_file_system.hpp>
#include <backend/mocks/file_system_mock.hpp>
#include <backend/transfer/transfer_engine.hpp>
#include <utility/temporary_directory.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

namespace Test
{
    using ::testing::_;
    using ::testing::HasSubstr;
    using ::testing::Return;

    namespace
    {
        class FailingReadStream : public IReadStream
        {
          public:
            std::expected<std::size_t, Error> read(std::span<char>) override
            {
                return std::unexpected(Error{.type = SharedData::FileSystemErrorType::ReadFailure, .message = "boom"});
            }
        };
    }

    class TransferEngineTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            std::filesystem::create_directories(source_);
            std::filesystem::create_directories(destination_);
        }

        static void writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::filesystem::create_directories(path.parent_path());
            std::ofstream writer{path, std::ios_base::binary};
            writer << content;
        }

        static std::string readFile(std::filesystem::path const& path)
        {
            std::ifstream reader{path, std::ios_base::binary};
            std::stringstream buffer;
            buffer << reader.rdbuf();
            return buffer.str();
        }

        static std::string makeContent(std::size_t size)
        {
            std::string content(size, '\0');
            for (std::size_t i = 0; i != size; ++i)
                content[i] = static_cast<char>('a' + (i * 7) % 26);
            return content;
        }

        Uploader makeUploader(IFileSystem& source, IFileSystem& destination)
        {
            return Uploader{source, destination, registry_, statusMessages_, TransferEngineOptions{.chunkSize = 1024}};
        }

        bool allMetersFinished() const
        {
            for (auto const& meter : registry_.snapshot())
            {
                if (!meter->isFinished())
                    return false;
            }
            return true;
        }

        Utility::TemporaryDirectory isolateDirectory_{};
        std::filesystem::path source_{isolateDirectory_.path() / "source"};
        std::filesystem::path destination_{isolateDirectory_.path() / "destination"};
        LocalFileSystem localFileSystem_{};
        ProgressRegistry registry_{};
        StatusMessages statusMessages_{};
    };

    TEST_F(TransferEngineTests, FileIsCopiedInChunks)
    {
        const auto content = makeContent(3000);
        writeFile(source_ / "a.bin", content);

        auto uploader = makeUploader(localFileSystem_, localFileSystem_);
        const auto result = uploader.run(SharedData::LocalEntry::file(source_ / "a.bin", content.size()), destination_);

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(result->filesCopied, 1u);
        EXPECT_EQ(result->bytesCopied, 3000u);
        EXPECT_EQ(readFile(destination_ / "a.bin"), content);

        const auto meters = registry_.snapshot();
        ASSERT_EQ(meters.size(), 1u);
        EXPECT_EQ(meters.front()->title(), "Uploading \"a.bin\"");
        EXPECT_TRUE(meters.front()->isFinished());
        EXPECT_DOUBLE_EQ(meters.front()->ratio(), 1.0);
    }

    TEST_F(TransferEngineTests, DownloadMeterIsTitledDownloading)
    {
        writeFile(source_ / "b.txt", "bee");

        Downloader downloader{localFileSystem_, localFileSystem_, registry_, statusMessages_};
        ASSERT_TRUE(downloader.run(SharedData::RemoteEntry::file(source_ / "b.txt", 3), destination_).has_value());
        ASSERT_EQ(registry_.size(), 1u);
        EXPECT_EQ(registry_.snapshot().front()->title(), "Downloading \"b.txt\"");
    }

    TEST_F(TransferEngineTests, ExistingFileIsNeverOverwritten)
    {
        writeFile(source_ / "a.txt", "new content");
        writeFile(destination_ / "a.txt", "old content");

        auto uploader = makeUploader(localFileSystem_, localFileSystem_);
        const auto result = uploader.run(SharedData::LocalEntry::file(source_ / "a.txt", 11), destination_);

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::TransferErrorType::RemoteFileExists);
        EXPECT_EQ(readFile(destination_ / "a.txt"), "old content");
    }

    TEST_F(TransferEngineTests, CollisionPerformsNoWrite)
    {
        ::testing::StrictMock<FileSystemMock> destination{};
        EXPECT_CALL(destination, exists(destination_ / "a.txt"))
            .WillOnce(Return(std::expected<bool, SharedData::FileSystemError>{true}));
        EXPECT_CALL(destination, openForWrite(_)).Times(0);
        EXPECT_CALL(destination, createDirectory(_)).Times(0);

        writeFile(source_ / "a.txt", "content");
        Downloader downloader{localFileSystem_, destination, registry_, statusMessages_};
        const auto result = downloader.run(SharedData::RemoteEntry::file(source_ / "a.txt", 7), destination_);

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::TransferErrorType::LocalFileExists);
        EXPECT_TRUE(registry_.empty());
    }

    TEST_F(TransferEngineTests, TwoLevelDirectoryIsCopiedByteIdentical)
    {
        const auto first = makeContent(2500);
        const auto second = makeContent(100);
        writeFile(source_ / "dir" / "first.bin", first);
        writeFile(source_ / "dir" / "sub" / "second.bin", second);
        writeFile(source_ / "dir" / ".hidden", "h");

        auto uploader = makeUploader(localFileSystem_, localFileSystem_);
        const auto result = uploader.run(SharedData::LocalEntry::directory(source_ / "dir"), destination_);

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(result->filesCopied, 3u);
        EXPECT_EQ(result->directoriesCreated, 2u);
        EXPECT_EQ(readFile(destination_ / "dir" / "first.bin"), first);
        EXPECT_EQ(readFile(destination_ / "dir" / "sub" / "second.bin"), second);
        EXPECT_EQ(readFile(destination_ / "dir" / ".hidden"), "h");

        EXPECT_TRUE(allMetersFinished());
        bool aggregateFound = false;
        for (auto const& meter : registry_.snapshot())
        {
            if (meter->kind() != ProgressMeter::Kind::DirectoryAggregate)
                continue;
            aggregateFound = true;
            EXPECT_EQ(meter->title(), "Uploading \"dir\"");
            EXPECT_EQ(meter->filesCompleted(), 3u);
            EXPECT_EQ(meter->bytesSent(), 2601u);
        }
        EXPECT_TRUE(aggregateFound);
    }

    TEST_F(TransferEngineTests, ExistingDirectoryIsNotMergedInto)
    {
        writeFile(source_ / "dir" / "a.txt", "a");
        std::filesystem::create_directories(destination_ / "dir");

        auto uploader = makeUploader(localFileSystem_, localFileSystem_);
        const auto result = uploader.run(SharedData::LocalEntry::directory(source_ / "dir"), destination_);

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::TransferErrorType::RemoteFileExists);
        EXPECT_FALSE(std::filesystem::exists(destination_ / "dir" / "a.txt"));
        EXPECT_TRUE(allMetersFinished());
    }

    TEST_F(TransferEngineTests, ParentMarkerIsRejected)
    {
        auto uploader = makeUploader(localFileSystem_, localFileSystem_);
        const auto upload = uploader.run(SharedData::LocalEntry::parentMarker(isolateDirectory_.path()), destination_);
        ASSERT_FALSE(upload.has_value());
        EXPECT_EQ(upload.error().type, SharedData::TransferErrorType::CannotUploadParent);

        Downloader downloader{localFileSystem_, localFileSystem_, registry_, statusMessages_};
        const auto download =
            downloader.run(SharedData::RemoteEntry::parentMarker(isolateDirectory_.path()), destination_);
        ASSERT_FALSE(download.has_value());
        EXPECT_EQ(download.error().type, SharedData::TransferErrorType::CannotDownloadParent);
    }

    TEST_F(TransferEngineTests, SymlinksAreSkippedWithWarning)
    {
        writeFile(source_ / "dir" / "target.txt", "t");
        std::filesystem::create_symlink(source_ / "dir" / "target.txt", source_ / "dir" / "link");

        auto uploader = makeUploader(localFileSystem_, localFileSystem_);
        const auto result = uploader.run(SharedData::LocalEntry::directory(source_ / "dir"), destination_);

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(result->symlinksSkipped, 1u);
        EXPECT_EQ(result->filesCopied, 1u);
        EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(destination_ / "dir" / "link")));

        const auto messages = statusMessages_.current();
        ASSERT_EQ(messages.size(), 1u);
        EXPECT_EQ(messages.front().severity, StatusMessages::Severity::Warning);
        EXPECT_THAT(messages.front().text, HasSubstr("link"));
    }

    TEST_F(TransferEngineTests, ReadFailureAbortsJobAndFinishesMeters)
    {
        ::testing::NiceMock<FileSystemMock> source{};
        ON_CALL(source, list(source_ / "dir")).WillByDefault([](std::filesystem::path const&) {
            return std::expected<std::vector<SharedData::FileInformation>, SharedData::FileSystemError>{
                std::vector<SharedData::FileInformation>{
                    {.path = "a.txt", .type = SharedData::FileType::Regular, .size = 10},
                    {.path = "b.txt", .type = SharedData::FileType::Regular, .size = 10},
                }};
        });
        ON_CALL(source, openForRead(_)).WillByDefault([](std::filesystem::path const&) {
            return std::expected<std::unique_ptr<IReadStream>, SharedData::FileSystemError>{
                std::make_unique<FailingReadStream>()};
        });

        auto uploader = makeUploader(source, localFileSystem_);
        const auto result = uploader.run(SharedData::LocalEntry::directory(source_ / "dir"), destination_);

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::TransferErrorType::SourceFailure);
        ASSERT_TRUE(result.error().cause.has_value());
        EXPECT_EQ(result.error().cause->type, SharedData::FileSystemErrorType::ReadFailure);
        EXPECT_FALSE(std::filesystem::exists(destination_ / "dir" / "b.txt"));
        EXPECT_TRUE(allMetersFinished());
    }
}
