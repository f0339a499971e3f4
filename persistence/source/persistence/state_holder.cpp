#include <persistence/state_holder.hpp>
#include <log/log.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <fstream>

namespace Persistence
{
    namespace
    {
        /// Absent and null members both mean unset.
        nlohmann::json withoutNulls(nlohmann::json const& json)
        {
            if (json.is_object())
            {
                auto result = nlohmann::json::object();
                for (auto const& [key, value] : json.items())
                {
                    if (!value.is_null())
                        result[key] = withoutNulls(value);
                }
                return result;
            }
            if (json.is_array())
            {
                auto result = nlohmann::json::array();
                for (auto const& value : json)
                    result.push_back(withoutNulls(value));
                return result;
            }
            return json;
        }
    }

    struct StateHolder::Implementation
    {
        std::filesystem::path path;
        State stateCache;

        explicit Implementation(std::filesystem::path path)
            : path{std::move(path)}
            , stateCache{}
        {}
    };

    StateHolder::StateHolder(std::filesystem::path path)
        : impl_{std::make_unique<Implementation>(std::move(path))}
    {}
    StateHolder::~StateHolder() = default;
    StateHolder::StateHolder(StateHolder&&) = default;
    StateHolder& StateHolder::operator=(StateHolder&&) = default;

    State& StateHolder::stateCache()
    {
        return impl_->stateCache;
    }

    State const& StateHolder::stateCache() const
    {
        return impl_->stateCache;
    }

    std::filesystem::path const& StateHolder::path() const
    {
        return impl_->path;
    }

    std::optional<std::filesystem::path> StateHolder::defaultPath()
    {
        if (char const* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
            return std::filesystem::path{xdg} / "twinpane" / "config.json";
        if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0')
            return std::filesystem::path{home} / ".config" / "twinpane" / "config.json";
        return std::nullopt;
    }

    void StateHolder::makeBackup() const
    {
        const auto backupFileName = [this]() {
            const auto now = std::chrono::system_clock::now();
            const auto time = fmt::format("{:%Y-%m-%d_%H-%M-%S}", std::chrono::floor<std::chrono::seconds>(now));
            return impl_->path.parent_path() / (impl_->path.filename().string() + ".backup_" + time);
        }();

        {
            std::ifstream reader{impl_->path, std::ios_base::binary};
            std::ofstream writer{backupFileName, std::ios_base::binary};
            writer << reader.rdbuf();
        }
        Log::info("StateHolder: Copied config file to backup: {}", backupFileName.string());
    }

    bool StateHolder::load()
    {
        std::error_code ec;
        if (impl_->path.has_parent_path())
            std::filesystem::create_directories(impl_->path.parent_path(), ec);

        const auto before = [this]() {
            std::ifstream reader{impl_->path, std::ios_base::binary};
            if (!reader.good())
            {
                Log::warn("StateHolder: Config file does not exist, creating it with defaults.");
                return nlohmann::json(nullptr);
            }
            try
            {
                return nlohmann::json::parse(reader, nullptr, true, true);
            }
            catch (nlohmann::json::exception const& e)
            {
                Log::error("StateHolder: Failed to parse config file: {}", e.what());
                makeBackup();
                return nlohmann::json(nullptr);
            }
        }();

        impl_->stateCache = State{};
        if (!before.is_null())
        {
            try
            {
                before.get_to(impl_->stateCache);
            }
            catch (nlohmann::json::exception const& e)
            {
                Log::error("StateHolder: Config file has unexpected content: {}", e.what());
                makeBackup();
                impl_->stateCache = State{};
            }
        }

        dataFixer(before.is_null() ? nlohmann::json::object() : before);
        return std::filesystem::exists(impl_->path, ec);
    }

    void StateHolder::dataFixer(nlohmann::json const& before)
    {
        impl_->stateCache.useDefaultsFrom(State::defaults());

        const auto after = nlohmann::json(impl_->stateCache);
        const auto diff = nlohmann::json::diff(withoutNulls(before), after);
        if (!diff.empty())
        {
            Log::warn("StateHolder: Config file misses some defaults, writing them back to disk: {}", diff.dump());
            save();
        }
    }

    bool StateHolder::save()
    {
        std::ofstream writer{impl_->path, std::ios_base::binary};
        if (!writer.good())
        {
            Log::error("StateHolder: Cannot write config file '{}'.", impl_->path.string());
            return false;
        }
        writer << nlohmann::json(impl_->stateCache).dump(4);
        return writer.good();
    }
}
