#pragma once

#include <log/log.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

namespace SecureShell
{
    /**
     * @brief Executes tasks sequentially in a separate thread.
     * libssh sessions must not be used from several threads at once, so every call into a session is funneled
     * through the processing thread of that session.
     */
    class ProcessingThread
    {
      public:
        ProcessingThread();
        ~ProcessingThread();
        ProcessingThread(ProcessingThread const&) = delete;
        ProcessingThread& operator=(ProcessingThread const&) = delete;
        ProcessingThread(ProcessingThread&&) = delete;
        ProcessingThread& operator=(ProcessingThread&&) = delete;

        /**
         * @brief Starts the processing thread.
         *
         * @param waitCycleTimeout The time to wait for a task to become available before checking if the thread should
         * stop.
         */
        void start(std::chrono::milliseconds const& waitCycleTimeout = std::chrono::seconds{1});

        /**
         * @brief Stops the processing thread. Tasks that are still pending are executed on the calling thread.
         */
        void stop();

        /**
         * @brief Returns true if the processing thread is running.
         */
        bool isRunning() const;

        /**
         * @brief Pushes a task to the processing thread. Tasks pushed before start() run once the thread is started.
         *
         * @param task The task to push.
         * @return true If the task was pushed.
         * @return false If the task was empty or the processing thread is shutting down.
         */
        bool pushTask(std::function<void()> task);

        /**
         * @brief Pushes a task that has a return value to the processing thread.
         * The return value is then accessible through the returned future.
         * When called from within the processing thread, the function is executed immediately.
         * If the task is rejected, the future holds a std::future_error (broken_promise).
         *
         * @param func The function to execute.
         * @return std::future<std::invoke_result_t<std::decay_t<Func>>> The future that will contain the return value.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            using ReturnType = std::invoke_result_t<std::decay_t<Func>>;
            auto promise = std::make_shared<std::promise<ReturnType>>();
            auto future = promise->get_future();
            auto task = [promise, func = std::forward<Func>(func)]() mutable {
                if constexpr (std::is_void_v<ReturnType>)
                {
                    func();
                    promise->set_value();
                }
                else
                {
                    promise->set_value(func());
                }
            };

            if (withinProcessingThread())
                task();
            else if (!pushTask(std::move(task)))
                Log::warn("ProcessingThread: Task rejected, its future reports a broken promise.");
            return future;
        }

        /**
         * @brief Returns true if the current thread is the processing thread.
         */
        bool withinProcessingThread() const
        {
            return processingThreadId_.load() == std::this_thread::get_id();
        }

      private:
        void run(std::chrono::milliseconds const& waitCycleTimeout);
        void executePending();

      private:
        std::thread thread_{};
        std::atomic_bool running_ = false;
        std::atomic_bool shuttingDown_ = false;
        std::atomic<std::thread::id> processingThreadId_{};

        std::mutex taskMutex_{};
        std::condition_variable taskCondition_{};
        std::deque<std::function<void()>> tasks_{};
    };
}
