#pragma once

#include <frontend/command_line.hpp>
#include <persistence/state/state.hpp>
#include <ssh/connection_error.hpp>
#include <ssh/session.hpp>

#include <expected>
#include <memory>
#include <string>

class Main
{
  public:
    Main(int const argc, char const* const* argv);

    Main(Main const&) = delete;
    Main& operator=(Main const&) = delete;
    Main(Main&&) = delete;
    Main& operator=(Main&&) = delete;

    /**
     * @brief Connects and runs the control loop until the user quits.
     *
     * @return The process exit code.
     */
    int run();

  private:
    std::expected<Persistence::State, std::string> loadState() const;
    void setupLogging(Persistence::State const& state) const;
    SecureShell::EstablishOptions establishOptions(Persistence::State const& state) const;
    std::expected<std::unique_ptr<SecureShell::Session>, SecureShell::ConnectionError>
    connect(Persistence::State const& state) const;
    int browse(SecureShell::Session& session, Persistence::State const& state) const;

  private:
    std::expected<CommandLineOptions, std::string> commandLine_;
};
