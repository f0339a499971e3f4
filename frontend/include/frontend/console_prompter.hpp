#pragma once

#include <ssh/user_prompter.hpp>

#include <iosfwd>
#include <optional>
#include <string>

/**
 * @brief Asks on the terminal. Passwords are read with echo switched off when the input is a terminal.
 */
class ConsolePrompter : public SecureShell::IUserPrompter
{
  public:
    /**
     * @param echoControlFd File descriptor whose echo is switched off for password input, -1 for none.
     */
    ConsolePrompter(std::istream& input, std::ostream& output, int echoControlFd = -1);

    std::optional<std::string> confirmHost(std::string const& message) override;
    std::optional<std::string> askPassword(std::string const& prompt) override;

  private:
    std::optional<std::string> readLine();

  private:
    std::istream* input_;
    std::ostream* output_;
    int echoControlFd_;
};
