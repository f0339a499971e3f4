#include <frontend/main.hpp>
#include <frontend/console_prompter.hpp>
#include <frontend/console_view.hpp>

#include <backend/file_commander.hpp>
#include <backend/file_system/local_file_system.hpp>
#include <backend/file_system/remote_file_system.hpp>
#include <log/log.hpp>
#include <persistence/state_holder.hpp>
#include <ssh/known_hosts_file.hpp>
#include <ssh/sftp_session.hpp>

#include <unistd.h>

#include <chrono>
#include <iostream>

Main::Main(int const argc, char const* const* argv)
    : commandLine_{parseCommandLine(argc, argv)}
{}

std::expected<Persistence::State, std::string> Main::loadState() const
{
    auto path = commandLine_->configFile ? commandLine_->configFile : Persistence::StateHolder::defaultPath();
    if (!path)
        return std::unexpected(std::string{"No configuration directory is known, pass one with --config."});

    Persistence::StateHolder holder{*path};
    if (!holder.load())
        std::cerr << "Configuration " << path->string() << " could not be read or written, using defaults.\n";

    auto state = holder.stateCache();
    state.useDefaultsFrom(Persistence::State::defaults());
    return state;
}

void Main::setupLogging(Persistence::State const& state) const
{
    auto const file = commandLine_->logFile ? commandLine_->logFile : state.log.file;
    auto const level = commandLine_->logLevel.value_or(*state.log.level);
    if (!Log::setup(file, level))
        std::cerr << "Cannot open log file " << file->string() << ", logging is disabled.\n";
}

SecureShell::EstablishOptions Main::establishOptions(Persistence::State const& state) const
{
    return SecureShell::EstablishOptions{
        .destination = commandLine_->destination,
        .port = commandLine_->port,
        .user = commandLine_->user,
        .transport =
            {
                .timeout = std::chrono::seconds{*state.connection.connectTimeoutSeconds},
                .compression = *state.connection.compression,
            },
        .tryAgentForAuthentication = *state.connection.tryAgentForAuthentication,
        .usePublicKeyAutoAuth = *state.connection.usePublicKeyAutoAuth,
    };
}

std::expected<std::unique_ptr<SecureShell::Session>, SecureShell::ConnectionError>
Main::connect(Persistence::State const& state) const
{
    auto knownHosts = state.connection.knownHostsFile;
    if (!knownHosts)
        knownHosts = SecureShell::KnownHostsFile::defaultLocation();
    if (!knownHosts)
    {
        return std::unexpected(SecureShell::ConnectionError{
            .type = SecureShell::ConnectionErrorType::HostFileCheckError,
            .message = "No known_hosts file is configured and no home directory is known.",
        });
    }

    SecureShell::KnownHostsFile trustStore{*knownHosts};
    ConsolePrompter prompter{std::cin, std::cout, STDIN_FILENO};
    return SecureShell::makeSession(establishOptions(state), trustStore, prompter);
}

int Main::browse(SecureShell::Session& session, Persistence::State const& state) const
{
    auto const futureTimeout = std::chrono::seconds{*state.transfer.futureTimeoutSeconds};

    auto sftpFuture = session.createSftpSession();
    if (sftpFuture.wait_for(futureTimeout) != std::future_status::ready)
    {
        std::cerr << "Opening the sftp subsystem timed out.\n";
        return 1;
    }
    auto sftp = sftpFuture.get();
    if (!sftp)
    {
        SecureShell::ConnectionError error{
            .type = SecureShell::ConnectionErrorType::SftpInitFailure,
            .message = sftp.error().toString(),
        };
        Log::error("Main: {}", error.toString());
        std::cerr << error.toString() << '\n';
        return 1;
    }

    auto remoteFileSystem = std::make_unique<RemoteFileSystem>(*sftp, futureTimeout);
    auto remoteDirectory = state.navigation.remoteStartDirectory;
    if (!remoteDirectory)
    {
        auto home = remoteFileSystem->homeDirectory();
        if (!home)
        {
            SecureShell::ConnectionError error{
                .type = SecureShell::ConnectionErrorType::UnableToFindHomeDirectory,
                .message = home.error().toString(),
            };
            Log::error("Main: {}", error.toString());
            std::cerr << error.toString() << '\n';
            return 1;
        }
        remoteDirectory = *home;
    }

    FileCommander commander{
        std::make_unique<LocalFileSystem>(),
        std::move(remoteFileSystem),
        FileCommanderOptions{
            .showHiddenFiles = commandLine_->showHiddenFiles.value_or(*state.navigation.showHiddenFiles),
            .chunkSize = *state.transfer.chunkSize,
        },
    };

    if (auto result = commander.open(*state.navigation.localStartDirectory, *remoteDirectory); !result)
    {
        Log::error("Main: Cannot open start directories: {}", result.error().toString());
        std::cerr << "Cannot open start directories: " << result.error().toString() << '\n';
        return 1;
    }

    ConsoleView view{commander, std::cin, std::cout};
    view.run();
    return 0;
}

int Main::run()
{
    if (!commandLine_)
    {
        std::cerr << "twinpane: " << commandLine_.error() << "\n\n" << commandLineUsage();
        return 1;
    }
    if (commandLine_->helpRequested)
    {
        std::cout << commandLineUsage();
        return 0;
    }

    auto state = loadState();
    if (!state)
    {
        std::cerr << state.error() << '\n';
        return 1;
    }
    setupLogging(*state);
    Log::info("Main: Connecting to {} as {}.", commandLine_->destination, commandLine_->user);

    auto session = connect(*state);
    if (!session)
    {
        Log::error("Main: {}", session.error().toString());
        std::cerr << session.error().toString() << '\n';
        return 1;
    }

    auto const exitCode = browse(**session, *state);
    Log::info("Main: Disconnecting.");
    return exitCode;
}

int main(int argc, char** argv)
{
    Main program{argc, argv};
    return program.run();
}
