#pragma once

#include <log/level.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief What the user passed on the command line. Unset optionals fall back to the configuration file.
 */
struct CommandLineOptions
{
    std::string destination{};
    std::optional<std::string> port{};
    std::string user{};
    std::optional<std::filesystem::path> configFile{};
    std::optional<bool> showHiddenFiles{};
    std::optional<Log::Level> logLevel{};
    std::optional<std::filesystem::path> logFile{};
    bool helpRequested{false};
};

/**
 * @brief Parses the program arguments. With --help the required options may be missing.
 *
 * @return The error text on unknown options, missing required ones or an unknown log level.
 */
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char const* const* argv);

std::string commandLineUsage();
