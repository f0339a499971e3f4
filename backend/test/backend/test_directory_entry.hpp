#pragma once

#include <backend/mocks/file_system_mock.hpp>
#include <backend/navigation/fetch_listing.hpp>
#include <shared_data/directory_entry.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace Test
{
    using SharedData::FileInformation;
    using SharedData::FileType;
    using SharedData::LocalEntry;
    using SharedData::RemoteEntry;

    namespace
    {
        template <typename EntryT>
        std::vector<std::string> namesOf(std::vector<EntryT> const& entries)
        {
            std::vector<std::string> names;
            for (auto const& entry : entries)
                names.push_back(entry.displayText());
            return names;
        }
    }

    TEST(DirectoryEntryTests, DisplayTextMarksKinds)
    {
        EXPECT_EQ(LocalEntry::file("/a/b.txt", 3).displayText(), "b.txt");
        EXPECT_EQ(LocalEntry::directory("/a/sub").displayText(), "sub/");
        EXPECT_EQ(LocalEntry::symlink("/a/link").displayText(), "link@");
        EXPECT_EQ(LocalEntry::parentMarker("/").displayText(), "..");
    }

    TEST(DirectoryEntryTests, OnlyFilesHaveASize)
    {
        EXPECT_EQ(RemoteEntry::file("/a/b", 42).size(), std::optional<std::uint64_t>{42});
        EXPECT_EQ(RemoteEntry::directory("/a/c").size(), std::nullopt);
        EXPECT_EQ(RemoteEntry::symlink("/a/d").size(), std::nullopt);
        EXPECT_EQ(RemoteEntry::parentMarker("/").size(), std::nullopt);
    }

    TEST(DirectoryEntryTests, ParentMarkerIsNeverHidden)
    {
        EXPECT_FALSE(LocalEntry::parentMarker("/home").isHidden());
        EXPECT_TRUE(LocalEntry::directory("/home/.git").isHidden());
        EXPECT_FALSE(LocalEntry::file("/home/a.txt", 0).isHidden());
    }

    TEST(DirectoryEntryTests, ParentMarkerSortsFirstThenByteOrder)
    {
        std::vector<LocalEntry> entries{
            LocalEntry::file("/x/b", 0),
            LocalEntry::file("/x/B", 0),
            LocalEntry::parentMarker("/"),
            LocalEntry::directory("/x/a"),
        };
        std::sort(entries.begin(), entries.end());
        EXPECT_EQ(namesOf(entries), (std::vector<std::string>{"..", "B", "a/", "b"}));
    }

    TEST(DirectoryEntryTests, RawRecordsAreConverted)
    {
        const auto file = LocalEntry::fromFileInformation("/x", FileInformation{.path = "f", .type = FileType::Regular, .size = 7});
        ASSERT_TRUE(file.has_value());
        EXPECT_TRUE(file->isFile());
        EXPECT_EQ(file->path(), std::filesystem::path{"/x/f"});
        EXPECT_EQ(file->size(), std::optional<std::uint64_t>{7});

        const auto special = LocalEntry::fromFileInformation("/x", FileInformation{.path = "p", .type = FileType::Fifo});
        ASSERT_TRUE(special.has_value());
        EXPECT_TRUE(special->isFile());

        EXPECT_TRUE(LocalEntry::fromFileInformation("/x", FileInformation{.path = "d", .type = FileType::Directory})
                        ->isDirectory());
        EXPECT_TRUE(
            LocalEntry::fromFileInformation("/x", FileInformation{.path = "l", .type = FileType::Symlink})->isSymlink());
        EXPECT_FALSE(LocalEntry::fromFileInformation("/x", FileInformation{.path = ".", .type = FileType::Directory}));
        EXPECT_FALSE(LocalEntry::fromFileInformation("/x", FileInformation{.path = "..", .type = FileType::Directory}));
    }

    class FetchListingTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            ON_CALL(fileSystem_, list).WillByDefault([](std::filesystem::path const&) {
                return std::expected<std::vector<FileInformation>, SharedData::FileSystemError>{std::vector<FileInformation>{
                    {.path = ".git", .type = FileType::Directory},
                    {.path = "a.txt", .type = FileType::Regular, .size = 5},
                    {.path = "..", .type = FileType::Directory},
                }};
            });
        }

        ::testing::NiceMock<FileSystemMock> fileSystem_{};
    };

    TEST_F(FetchListingTests, HiddenEntriesAreFilteredButParentStaysFirst)
    {
        const auto hidden = fetchListing<SharedData::Namespace::Remote>(fileSystem_, "/srv/data", false);
        ASSERT_TRUE(hidden.has_value());
        EXPECT_EQ(namesOf(*hidden), (std::vector<std::string>{"..", "a.txt"}));

        const auto shown = fetchListing<SharedData::Namespace::Remote>(fileSystem_, "/srv/data", true);
        ASSERT_TRUE(shown.has_value());
        EXPECT_EQ(namesOf(*shown), (std::vector<std::string>{"..", ".git/", "a.txt"}));
    }

    TEST_F(FetchListingTests, RootHasNoParentMarker)
    {
        const auto listing = fetchListing<SharedData::Namespace::Remote>(fileSystem_, "/", false);
        ASSERT_TRUE(listing.has_value());
        EXPECT_EQ(namesOf(*listing), (std::vector<std::string>{"a.txt"}));
    }

    TEST_F(FetchListingTests, ParentMarkerPointsToParentDirectory)
    {
        const auto listing = fetchListing<SharedData::Namespace::Remote>(fileSystem_, "/srv/data/", false);
        ASSERT_TRUE(listing.has_value());
        ASSERT_FALSE(listing->empty());
        EXPECT_TRUE(listing->front().isParentMarker());
        EXPECT_EQ(listing->front().path(), std::filesystem::path{"/srv"});
    }

    TEST_F(FetchListingTests, ListErrorsPropagate)
    {
        ON_CALL(fileSystem_, list).WillByDefault([](std::filesystem::path const& path) {
            return std::expected<std::vector<FileInformation>, SharedData::FileSystemError>{
                std::unexpect,
                SharedData::FileSystemError{.type = SharedData::FileSystemErrorType::ListFailure, .path = path},
            };
        });

        const auto listing = fetchListing<SharedData::Namespace::Local>(fileSystem_, "/srv", false);
        ASSERT_FALSE(listing.has_value());
        EXPECT_EQ(listing.error().type, SharedData::FileSystemErrorType::ListFailure);
    }
}
