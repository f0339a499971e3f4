#include <ssh/async/processing_thread.hpp>

namespace SecureShell
{
    ProcessingThread::ProcessingThread() = default;

    ProcessingThread::~ProcessingThread()
    {
        stop();
    }

    bool ProcessingThread::isRunning() const
    {
        return running_;
    }

    void ProcessingThread::start(std::chrono::milliseconds const& waitCycleTimeout)
    {
        if (running_.exchange(true))
            return;

        shuttingDown_ = false;
        std::promise<void> awaitThreadStart{};
        auto started = awaitThreadStart.get_future();
        thread_ = std::thread([this, &awaitThreadStart, waitCycleTimeout] {
            processingThreadId_.store(std::this_thread::get_id());
            awaitThreadStart.set_value();
            run(waitCycleTimeout);
        });
        started.wait();
    }

    void ProcessingThread::stop()
    {
        {
            std::scoped_lock lock{taskMutex_};
            shuttingDown_ = true;
        }
        taskCondition_.notify_all();
        if (thread_.joinable())
            thread_.join();
        processingThreadId_.store(std::thread::id{});

        // Whatever was pushed but never ran is executed here, so no promise is left dangling.
        executePending();
        running_ = false;
        shuttingDown_ = false;
    }

    bool ProcessingThread::pushTask(std::function<void()> task)
    {
        if (!task)
            return false;

        {
            std::scoped_lock lock{taskMutex_};
            if (shuttingDown_)
                return false;
            tasks_.push_back(std::move(task));
        }
        taskCondition_.notify_one();
        return true;
    }

    void ProcessingThread::executePending()
    {
        while (true)
        {
            std::function<void()> task;
            {
                std::scoped_lock lock{taskMutex_};
                if (tasks_.empty())
                    return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    void ProcessingThread::run(std::chrono::milliseconds const& waitCycleTimeout)
    {
        while (true)
        {
            std::function<void()> task;
            {
                std::unique_lock lock{taskMutex_};
                taskCondition_.wait_for(lock, waitCycleTimeout, [this] {
                    return !tasks_.empty() || shuttingDown_;
                });
                if (tasks_.empty())
                {
                    if (shuttingDown_)
                        return;
                    continue;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }
}
