#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

/**
 * @brief Tracks the bytes sent for one file, or the files and bytes completed for a whole directory transfer.
 * Written by one transfer worker, read concurrently by the view.
 */
class ProgressMeter
{
  public:
    using Clock = std::chrono::steady_clock;

    enum class Kind
    {
        File,
        DirectoryAggregate
    };

    /// Samples older than this are not considered for the throughput.
    constexpr static std::chrono::seconds historyWindow{5};

    ProgressMeter(std::string title, std::uint64_t totalBytes, Clock::time_point now = Clock::now());
    ProgressMeter(std::string title, Kind kind, std::uint64_t totalBytes, Clock::time_point now);
    ProgressMeter(ProgressMeter const&) = delete;
    ProgressMeter& operator=(ProgressMeter const&) = delete;
    ProgressMeter(ProgressMeter&&) = delete;
    ProgressMeter& operator=(ProgressMeter&&) = delete;

    /**
     * @brief Creates a meter that counts the files of a directory transfer instead of showing a ratio.
     */
    static std::shared_ptr<ProgressMeter> directory(std::string title);

    /**
     * @brief Accounts bytes that were written successfully.
     */
    void record(std::uint64_t bytes);
    void record(std::uint64_t bytes, Clock::time_point now);

    /**
     * @brief Accounts a whole file of an aggregate meter.
     */
    void addCompletedFile(std::uint64_t bytes);

    /**
     * @brief The bitrate over the retained samples, 0 if they span no time.
     */
    std::uint64_t throughputBitsPerSecond() const;

    /**
     * @brief Estimated remaining time. Zero once finished, std::nullopt if it cannot be estimated.
     */
    std::optional<std::chrono::milliseconds> eta() const;

    /**
     * @brief Marks the meter as done, a file meter then reports all bytes as sent. Repeated calls do nothing.
     */
    void finish();

    bool isFinished() const;

    /// In [0, 1], 0 for empty totals.
    double ratio() const;

    std::string const& title() const;
    Kind kind() const;
    std::uint64_t bytesSent() const;
    std::uint64_t totalBytes() const;
    std::uint64_t filesCompleted() const;

  private:
    std::string title_;
    Kind kind_;
    std::uint64_t totalBytes_;
    std::atomic<std::uint64_t> bytesSent_;
    std::atomic<std::uint64_t> filesCompleted_;
    std::atomic<bool> finished_;
    mutable std::mutex historyGuard_;
    std::deque<std::pair<Clock::time_point, std::uint64_t>> history_;
};
