#include <backend/transfer/transfer_dispatcher.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <exception>
#include <iterator>

TransferDispatcher::~TransferDispatcher()
{
    joinAll();
}

void TransferDispatcher::dispatch(std::function<void()> work)
{
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread{[work = std::move(work), done]() {
        try
        {
            work();
        }
        catch (std::exception const& exc)
        {
            Log::error("TransferDispatcher: Worker failed with exception: {}", exc.what());
        }
        done->store(true);
    }};

    std::scoped_lock lock{guard_};
    workers_.push_back(Worker{.thread = std::move(thread), .done = std::move(done)});
}

std::size_t TransferDispatcher::reap()
{
    std::vector<Worker> finished;
    {
        std::scoped_lock lock{guard_};
        auto partition = std::stable_partition(workers_.begin(), workers_.end(), [](auto const& worker) {
            return !worker.done->load();
        });
        std::move(partition, workers_.end(), std::back_inserter(finished));
        workers_.erase(partition, workers_.end());
    }

    for (auto& worker : finished)
        worker.thread.join();
    return finished.size();
}

std::size_t TransferDispatcher::size() const
{
    std::scoped_lock lock{guard_};
    return workers_.size();
}

std::size_t TransferDispatcher::running() const
{
    std::scoped_lock lock{guard_};
    return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(), [](auto const& worker) {
        return !worker.done->load();
    }));
}

void TransferDispatcher::joinAll()
{
    std::vector<Worker> workers;
    {
        std::scoped_lock lock{guard_};
        workers = std::move(workers_);
        workers_.clear();
    }

    if (!workers.empty())
        Log::info("TransferDispatcher: Waiting for {} transfer workers.", workers.size());
    for (auto& worker : workers)
        worker.thread.join();
}
