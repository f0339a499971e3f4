#include <backend/progress/progress_meter.hpp>

#include <algorithm>

ProgressMeter::ProgressMeter(std::string title, std::uint64_t totalBytes, Clock::time_point now)
    : ProgressMeter{std::move(title), Kind::File, totalBytes, now}
{}

ProgressMeter::ProgressMeter(std::string title, Kind kind, std::uint64_t totalBytes, Clock::time_point now)
    : title_{std::move(title)}
    , kind_{kind}
    , totalBytes_{totalBytes}
    , bytesSent_{0}
    , filesCompleted_{0}
    , finished_{false}
    , historyGuard_{}
    , history_{{now, 0}}
{}

std::shared_ptr<ProgressMeter> ProgressMeter::directory(std::string title)
{
    return std::make_shared<ProgressMeter>(std::move(title), Kind::DirectoryAggregate, 0, Clock::now());
}

void ProgressMeter::record(std::uint64_t bytes)
{
    record(bytes, Clock::now());
}

void ProgressMeter::record(std::uint64_t bytes, Clock::time_point now)
{
    {
        std::scoped_lock lock{historyGuard_};
        history_.emplace_back(now, bytes);
        const auto oldestAllowed = now - historyWindow;
        while (!history_.empty() && history_.front().first <= oldestAllowed)
            history_.pop_front();
    }
    bytesSent_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressMeter::addCompletedFile(std::uint64_t bytes)
{
    bytesSent_.fetch_add(bytes, std::memory_order_relaxed);
    filesCompleted_.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t ProgressMeter::throughputBitsPerSecond() const
{
    std::scoped_lock lock{historyGuard_};
    if (history_.empty())
        return 0;

    std::uint64_t bytes = 0;
    auto oldest = history_.front().first;
    auto newest = history_.front().first;
    for (auto const& [time, delta] : history_)
    {
        bytes += delta;
        oldest = std::min(oldest, time);
        newest = std::max(newest, time);
    }

    const auto seconds = std::chrono::duration<double>(newest - oldest).count();
    if (seconds <= 0.0)
        return 0;
    return static_cast<std::uint64_t>(static_cast<double>(bytes * 8) / seconds);
}

std::optional<std::chrono::milliseconds> ProgressMeter::eta() const
{
    if (isFinished())
        return std::chrono::milliseconds{0};

    const auto bytesPerSecond = throughputBitsPerSecond() / 8;
    if (bytesPerSecond == 0)
        return std::nullopt;

    const auto sent = bytesSent();
    if (sent > totalBytes_)
        return std::nullopt;

    const auto remaining = static_cast<double>(totalBytes_ - sent);
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(remaining * 1000.0 / static_cast<double>(bytesPerSecond))};
}

void ProgressMeter::finish()
{
    if (finished_.exchange(true))
        return;

    if (kind_ == Kind::File)
        bytesSent_.store(totalBytes_, std::memory_order_relaxed);
    std::scoped_lock lock{historyGuard_};
    history_.clear();
}

bool ProgressMeter::isFinished() const
{
    return finished_.load();
}

double ProgressMeter::ratio() const
{
    if (totalBytes_ == 0)
        return 0.0;

    const auto sent = bytesSent();
    if (sent >= totalBytes_)
        return 1.0;
    return static_cast<double>(sent) / static_cast<double>(totalBytes_);
}

std::string const& ProgressMeter::title() const
{
    return title_;
}

ProgressMeter::Kind ProgressMeter::kind() const
{
    return kind_;
}

std::uint64_t ProgressMeter::bytesSent() const
{
    return bytesSent_.load(std::memory_order_relaxed);
}

std::uint64_t ProgressMeter::totalBytes() const
{
    return totalBytes_;
}

std::uint64_t ProgressMeter::filesCompleted() const
{
    return filesCompleted_.load(std::memory_order_relaxed);
}
