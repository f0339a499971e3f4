#pragma once

#include <frontend/command_line.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace Test
{
    class CommandLineTests : public ::testing::Test
    {
      protected:
        static std::expected<CommandLineOptions, std::string> parse(std::vector<char const*> arguments)
        {
            arguments.insert(arguments.begin(), "twinpane");
            return parseCommandLine(static_cast<int>(arguments.size()), arguments.data());
        }
    };

    TEST_F(CommandLineTests, DestinationAndUserAreEnough)
    {
        const auto options = parse({"-u", "alice", "example.org"});
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->destination, "example.org");
        EXPECT_EQ(options->user, "alice");
        EXPECT_FALSE(options->port.has_value());
        EXPECT_FALSE(options->configFile.has_value());
        EXPECT_FALSE(options->showHiddenFiles.has_value());
        EXPECT_FALSE(options->logLevel.has_value());
        EXPECT_FALSE(options->helpRequested);
    }

    TEST_F(CommandLineTests, AllOptionsAreTakenOver)
    {
        const auto options = parse(
            {"--port",
             "2222",
             "--user",
             "bob",
             "--config",
             "/tmp/twinpane.json",
             "--show-hidden",
             "--log-level",
             "warn",
             "--log-file",
             "/tmp/twinpane.log",
             "host"});
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->port, std::optional<std::string>{"2222"});
        EXPECT_EQ(options->user, "bob");
        EXPECT_EQ(options->configFile, std::optional<std::filesystem::path>{"/tmp/twinpane.json"});
        EXPECT_EQ(options->showHiddenFiles, std::optional<bool>{true});
        EXPECT_EQ(options->logLevel, std::optional<Log::Level>{Log::Level::Warning});
        EXPECT_EQ(options->logFile, std::optional<std::filesystem::path>{"/tmp/twinpane.log"});
        EXPECT_EQ(options->destination, "host");
    }

    TEST_F(CommandLineTests, PortIsPassedUnparsed)
    {
        const auto options = parse({"-p", "not-a-port", "-u", "alice", "host"});
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->port, std::optional<std::string>{"not-a-port"});
    }

    TEST_F(CommandLineTests, MissingUserIsAnError)
    {
        EXPECT_FALSE(parse({"host"}).has_value());
    }

    TEST_F(CommandLineTests, MissingDestinationIsAnError)
    {
        EXPECT_FALSE(parse({"-u", "alice"}).has_value());
    }

    TEST_F(CommandLineTests, UnknownOptionIsAnError)
    {
        EXPECT_FALSE(parse({"-u", "alice", "--frobnicate", "host"}).has_value());
    }

    TEST_F(CommandLineTests, UnknownLogLevelIsAnError)
    {
        const auto options = parse({"-u", "alice", "--log-level", "loud", "host"});
        ASSERT_FALSE(options.has_value());
        EXPECT_NE(options.error().find("loud"), std::string::npos);
    }

    TEST_F(CommandLineTests, HelpNeedsNoOtherOption)
    {
        const auto options = parse({"--help"});
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->helpRequested);
    }

    TEST_F(CommandLineTests, UsageListsTheOptions)
    {
        const auto usage = commandLineUsage();
        EXPECT_NE(usage.find("--user"), std::string::npos);
        EXPECT_NE(usage.find("--show-hidden"), std::string::npos);
        EXPECT_EQ(usage.find("--destination"), std::string::npos);
    }
}
