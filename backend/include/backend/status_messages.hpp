#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief The short lived messages shown below the panes.
 */
class StatusMessages
{
  public:
    using Clock = std::chrono::steady_clock;

    enum class Severity
    {
        Info,
        Warning,
        Error
    };

    struct Message
    {
        Clock::time_point time;
        Severity severity;
        std::string text;
    };

    /// Appending drops the oldest message once this many are queued.
    constexpr static std::size_t maximumMessages = 5;
    constexpr static std::chrono::seconds maximumAge{10};

    void report(std::string text);
    void warn(std::string text);
    void error(std::string text);

    void push(Severity severity, std::string text, Clock::time_point now = Clock::now());

    /**
     * @brief Drops expired messages and returns the remaining ones, oldest first.
     */
    std::vector<Message> current(Clock::time_point now = Clock::now());

  private:
    std::mutex guard_;
    std::deque<Message> messages_;
};
