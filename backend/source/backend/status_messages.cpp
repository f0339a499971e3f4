#include <backend/status_messages.hpp>
#include <log/log.hpp>

void StatusMessages::report(std::string text)
{
    push(Severity::Info, std::move(text));
}

void StatusMessages::warn(std::string text)
{
    push(Severity::Warning, std::move(text));
}

void StatusMessages::error(std::string text)
{
    push(Severity::Error, std::move(text));
}

void StatusMessages::push(Severity severity, std::string text, Clock::time_point now)
{
    switch (severity)
    {
        case Severity::Info:
            Log::info("StatusMessages: {}", text);
            break;
        case Severity::Warning:
            Log::warn("StatusMessages: {}", text);
            break;
        case Severity::Error:
            Log::error("StatusMessages: {}", text);
            break;
    }

    std::scoped_lock lock{guard_};
    messages_.push_back(Message{.time = now, .severity = severity, .text = std::move(text)});
    if (messages_.size() >= maximumMessages)
        messages_.pop_front();
}

std::vector<StatusMessages::Message> StatusMessages::current(Clock::time_point now)
{
    std::scoped_lock lock{guard_};
    const auto oldestAllowed = now - maximumAge;
    while (!messages_.empty() && messages_.front().time < oldestAllowed)
        messages_.pop_front();
    return {messages_.begin(), messages_.end()};
}
