#pragma once

#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>

namespace Utility::Test
{
    TEST(TemporaryDirectoryTests, DirectoryAndContentsAreRemovedOnDestruction)
    {
        std::filesystem::path path;
        {
            TemporaryDirectory directory{};
            path = directory.path();
            ASSERT_TRUE(std::filesystem::is_directory(path));
            std::filesystem::create_directory(path / "sub");
            std::ofstream{path / "sub" / "file"} << "content";
        }
        EXPECT_FALSE(std::filesystem::exists(path));
    }

    TEST(TemporaryDirectoryTests, TwoInstancesDoNotShareADirectory)
    {
        TemporaryDirectory first{};
        TemporaryDirectory second{};
        EXPECT_NE(first.path(), second.path());
    }
}
