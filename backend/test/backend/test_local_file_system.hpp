#pragma once

#include <backend/file_system/local_file_system.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace Test
{
    namespace
    {
        /// Yields the given entries and reports an io error when advancing past entry failAfter.
        class InterruptedDirectoryIterator
        {
          public:
            InterruptedDirectoryIterator() = default;
            InterruptedDirectoryIterator(std::vector<std::filesystem::directory_entry> entries, std::size_t failAfter)
                : entries_{std::move(entries)}
                , failAfter_{failAfter}
            {}

            std::filesystem::directory_entry const& operator*() const
            {
                return entries_[position_];
            }

            InterruptedDirectoryIterator& increment(std::error_code& ec)
            {
                ++position_;
                if (position_ == failAfter_)
                {
                    ec = std::make_error_code(std::errc::io_error);
                    entries_.clear();
                    position_ = 0;
                }
                return *this;
            }

            bool operator==(InterruptedDirectoryIterator const& other) const
            {
                return atEnd() == other.atEnd();
            }

          private:
            bool atEnd() const
            {
                return position_ >= entries_.size();
            }

          private:
            std::vector<std::filesystem::directory_entry> entries_{};
            std::size_t position_{0};
            std::size_t failAfter_{0};
        };
    }

    class LocalFileSystemTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            std::ofstream{isolateDirectory_.path() / "a.txt"} << "abc";
            std::ofstream{isolateDirectory_.path() / "b.txt"} << "de";
        }

        std::vector<std::filesystem::directory_entry> entries() const
        {
            return {
                std::filesystem::directory_entry{isolateDirectory_.path() / "a.txt"},
                std::filesystem::directory_entry{isolateDirectory_.path() / "b.txt"},
            };
        }

        Utility::TemporaryDirectory isolateDirectory_{};
        LocalFileSystem fileSystem_{};
    };

    TEST_F(LocalFileSystemTests, ListReportsSizesOfRegularFiles)
    {
        auto listing = fileSystem_.list(isolateDirectory_.path());
        ASSERT_TRUE(listing.has_value());
        ASSERT_EQ(listing->size(), 2u);

        std::sort(listing->begin(), listing->end(), [](auto const& lhs, auto const& rhs) {
            return lhs.path < rhs.path;
        });
        EXPECT_EQ(listing->at(0).path, "a.txt");
        EXPECT_EQ(listing->at(0).size, 3u);
        EXPECT_EQ(listing->at(1).path, "b.txt");
        EXPECT_EQ(listing->at(1).size, 2u);
    }

    TEST_F(LocalFileSystemTests, ListOfMissingDirectoryIsNotFound)
    {
        const auto listing = fileSystem_.list(isolateDirectory_.path() / "missing");
        ASSERT_FALSE(listing.has_value());
        EXPECT_EQ(listing.error().type, SharedData::FileSystemErrorType::NotFound);
    }

    TEST_F(LocalFileSystemTests, ErrorWhileAdvancingEndsTheListing)
    {
        const auto listing =
            Detail::readDirectory(InterruptedDirectoryIterator{entries(), 1}, isolateDirectory_.path());
        ASSERT_FALSE(listing.has_value());
        EXPECT_EQ(listing.error().type, SharedData::FileSystemErrorType::ListFailure);
        EXPECT_EQ(listing.error().path, isolateDirectory_.path());
        EXPECT_FALSE(listing.error().message.empty());
    }

    TEST_F(LocalFileSystemTests, IteratorWithoutErrorIsDrained)
    {
        const auto listing =
            Detail::readDirectory(InterruptedDirectoryIterator{entries(), 5}, isolateDirectory_.path());
        ASSERT_TRUE(listing.has_value());
        EXPECT_EQ(listing->size(), 2u);
    }
}
