#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    Logger::Logger()
        : guard_{}
        , logger_{std::make_shared<spdlog::logger>("twinpane", std::make_shared<spdlog::sinks::null_sink_mt>())}
    {
        logger_->set_level(spdlog::level::info);
    }

    bool Logger::setup(std::optional<std::filesystem::path> const& file, Log::Level level)
    {
        std::shared_ptr<spdlog::logger> replacement;
        bool success = true;
        if (file)
        {
            try
            {
                if (file->has_parent_path())
                    std::filesystem::create_directories(file->parent_path());
                replacement = std::make_shared<spdlog::logger>(
                    "twinpane", std::make_shared<spdlog::sinks::basic_file_sink_mt>(file->string(), false));
            }
            catch (spdlog::spdlog_ex const&)
            {
                success = false;
            }
            catch (std::filesystem::filesystem_error const&)
            {
                success = false;
            }
        }
        if (!replacement)
            replacement = std::make_shared<spdlog::logger>("twinpane", std::make_shared<spdlog::sinks::null_sink_mt>());

        replacement->set_level(toSpdlogLevel(level));
        replacement->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        replacement->flush_on(spdlog::level::warn);

        std::scoped_lock lock{guard_};
        logger_ = std::move(replacement);
        return success;
    }

    void Logger::setLevel(Log::Level level)
    {
        std::scoped_lock lock{guard_};
        logger_->set_level(toSpdlogLevel(level));
    }

    Log::Level Logger::level() const
    {
        std::scoped_lock lock{guard_};
        return fromSpdlogLevel(logger_->level());
    }

    bool setup(std::optional<std::filesystem::path> const& file, Log::Level level)
    {
        return Detail::logger.setup(file, level);
    }
}
