#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    /**
     * @brief Owns the spdlog logger all Log:: functions write to.
     *
     * Until setup() is called, messages go to a logger without sinks.
     */
    class Logger
    {
      public:
        Logger();

        /**
         * @brief Replaces the sink. With a file, messages are appended to it, otherwise they are dropped.
         * The terminal is never used, it belongs to the user interface.
         *
         * @return false if the file sink could not be created. The logger then stays silent.
         */
        bool setup(std::optional<std::filesystem::path> const& file, Log::Level level);

        void setLevel(Log::Level level);
        Log::Level level() const;

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            std::shared_ptr<spdlog::logger> logger;
            {
                std::scoped_lock lock{guard_};
                logger = logger_;
            }
            if (!logger->should_log(toSpdlogLevel(level)))
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logger->log(toSpdlogLevel(level), buf);
        }

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
