#include <frontend/console_prompter.hpp>
#include <log/log.hpp>

#include <termios.h>
#include <unistd.h>

#include <istream>
#include <ostream>

namespace
{
    class EchoSuppression
    {
      public:
        explicit EchoSuppression(int fd)
            : fd_{fd}
            , original_{}
            , active_{false}
        {
            if (fd_ < 0 || ::isatty(fd_) != 1)
                return;
            if (::tcgetattr(fd_, &original_) != 0)
            {
                Log::warn("ConsolePrompter: Cannot read terminal attributes, password will be echoed.");
                return;
            }
            termios silent = original_;
            silent.c_lflag &= static_cast<tcflag_t>(~ECHO);
            active_ = ::tcsetattr(fd_, TCSAFLUSH, &silent) == 0;
            if (!active_)
                Log::warn("ConsolePrompter: Cannot switch off echo, password will be echoed.");
        }
        ~EchoSuppression()
        {
            if (active_)
                ::tcsetattr(fd_, TCSAFLUSH, &original_);
        }
        EchoSuppression(EchoSuppression const&) = delete;
        EchoSuppression& operator=(EchoSuppression const&) = delete;

        bool active() const
        {
            return active_;
        }

      private:
        int fd_;
        termios original_;
        bool active_;
    };
}

ConsolePrompter::ConsolePrompter(std::istream& input, std::ostream& output, int echoControlFd)
    : input_{&input}
    , output_{&output}
    , echoControlFd_{echoControlFd}
{}

std::optional<std::string> ConsolePrompter::readLine()
{
    std::string line;
    if (!std::getline(*input_, line))
    {
        Log::info("ConsolePrompter: Input closed while waiting for an answer.");
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::optional<std::string> ConsolePrompter::confirmHost(std::string const& message)
{
    *output_ << message << ' ' << std::flush;
    return readLine();
}

std::optional<std::string> ConsolePrompter::askPassword(std::string const& prompt)
{
    *output_ << prompt << std::flush;
    std::optional<std::string> password;
    {
        EchoSuppression suppression{echoControlFd_};
        password = readLine();
        if (suppression.active())
            *output_ << '\n';
    }
    return password;
}
