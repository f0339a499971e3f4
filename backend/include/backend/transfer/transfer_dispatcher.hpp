#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief Runs every top-level transfer on a thread of its own.
 * There is no cancellation, destruction waits for all workers.
 */
class TransferDispatcher
{
  public:
    TransferDispatcher() = default;
    ~TransferDispatcher();
    TransferDispatcher(TransferDispatcher const&) = delete;
    TransferDispatcher& operator=(TransferDispatcher const&) = delete;
    TransferDispatcher(TransferDispatcher&&) = delete;
    TransferDispatcher& operator=(TransferDispatcher&&) = delete;

    void dispatch(std::function<void()> work);

    /**
     * @brief Joins the workers that are done.
     *
     * @return The amount of workers joined.
     */
    std::size_t reap();

    /**
     * @brief Amount of workers not yet reaped, finished or not.
     */
    std::size_t size() const;

    /**
     * @brief Amount of workers still running.
     */
    std::size_t running() const;

    void joinAll();

  private:
    struct Worker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex guard_{};
    std::vector<Worker> workers_{};
};
