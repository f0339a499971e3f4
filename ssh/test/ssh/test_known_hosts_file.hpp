#pragma once

#include <ssh/known_hosts_file.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

namespace SecureShell::Test
{
    class KnownHostsFileTests : public ::testing::Test
    {
      protected:
        std::string readFile() const
        {
            std::ifstream reader{file_, std::ios_base::binary};
            std::stringstream buffer;
            buffer << reader.rdbuf();
            return buffer.str();
        }

        void writeFile(std::string const& content) const
        {
            std::ofstream writer{file_, std::ios_base::binary};
            writer << content;
        }

        Utility::TemporaryDirectory isolateDirectory_{};
        std::filesystem::path file_{isolateDirectory_.path() / ".ssh" / "known_hosts"};
        KnownHostsFile knownHosts_{file_};
        HostKey key_{.type = "ssh-ed25519", .base64 = "AAAAC3NzaC1lZDI1NTE5AAAAIKey1", .fingerprint = "SHA256:abc"};
    };

    TEST_F(KnownHostsFileTests, MissingFileKnowsNoHost)
    {
        const auto result = knownHosts_.check("example.com", 22, key_);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, TrustCheckResult::NotFound);
    }

    TEST_F(KnownHostsFileTests, HostPatternContainsPortOnlyIfNotDefault)
    {
        EXPECT_EQ(KnownHostsFile::hostPattern("example.com", 22), "example.com");
        EXPECT_EQ(KnownHostsFile::hostPattern("example.com", 2222), "[example.com]:2222");
    }

    TEST_F(KnownHostsFileTests, AddedKeyIsWrittenInOpenSshFormatAndMatches)
    {
        ASSERT_TRUE(knownHosts_.add("example.com", 2222, key_).has_value());
        EXPECT_EQ(readFile(), "[example.com]:2222 ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKey1\n");

        const auto result = knownHosts_.check("example.com", 2222, key_);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, TrustCheckResult::Match);
    }

    TEST_F(KnownHostsFileTests, DifferentKeyOfKnownHostIsMismatch)
    {
        ASSERT_TRUE(knownHosts_.add("example.com", 22, key_).has_value());
        auto otherKey = key_;
        otherKey.base64 = "AAAAC3NzaC1lZDI1NTE5AAAAIKey2";

        const auto result = knownHosts_.check("example.com", 22, otherKey);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, TrustCheckResult::Mismatch);
    }

    TEST_F(KnownHostsFileTests, SameHostOnOtherPortIsNotKnown)
    {
        ASSERT_TRUE(knownHosts_.add("example.com", 22, key_).has_value());

        const auto result = knownHosts_.check("example.com", 2222, key_);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, TrustCheckResult::NotFound);
    }

    TEST_F(KnownHostsFileTests, AnyOfSeveralKeysOfAHostMatches)
    {
        std::filesystem::create_directories(file_.parent_path());
        writeFile(
            "example.com ssh-rsa AAAAB3NzaC1yc2EAAAADAQABAAABAQ\n"
            "example.com ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKey1\n");

        const auto result = knownHosts_.check("example.com", 22, key_);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, TrustCheckResult::Match);
    }

    TEST_F(KnownHostsFileTests, CommentsHashedAndMarkerLinesAreSkipped)
    {
        std::filesystem::create_directories(file_.parent_path());
        writeFile(
            "# a comment\n"
            "\n"
            "|1|c2FsdA==|aGFzaA== ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKey9\n"
            "@revoked example.com ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKey9\n"
            "other.org,example.com ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKey1\n");

        const auto result = knownHosts_.check("example.com", 22, key_);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, TrustCheckResult::Match);
    }

    TEST_F(KnownHostsFileTests, AddKeepsExistingContentAndTerminatesLastLine)
    {
        std::filesystem::create_directories(file_.parent_path());
        writeFile("other.org ssh-rsa AAAAB3NzaC1yc2EAAAADAQABAAABAQ");

        ASSERT_TRUE(knownHosts_.add("example.com", 22, key_).has_value());
        EXPECT_EQ(
            readFile(),
            "other.org ssh-rsa AAAAB3NzaC1yc2EAAAADAQABAAABAQ\n"
            "example.com ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKey1\n");
    }

    TEST_F(KnownHostsFileTests, DirectoryInPlaceOfFileCannotBeChecked)
    {
        std::filesystem::create_directories(file_);
        EXPECT_FALSE(knownHosts_.check("example.com", 22, key_).has_value());
    }
}
