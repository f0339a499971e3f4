#pragma once

#include <persistence/state/state.hpp>

#include <filesystem>
#include <memory>
#include <optional>

namespace Persistence
{
    /**
     * @brief Loads and saves the configuration file.
     */
    class StateHolder
    {
      public:
        explicit StateHolder(std::filesystem::path path);
        ~StateHolder();
        StateHolder(StateHolder const&) = delete;
        StateHolder& operator=(StateHolder const&) = delete;
        StateHolder(StateHolder&&);
        StateHolder& operator=(StateHolder&&);

        /**
         * @brief Reads the configuration file. A missing file is created with defaults, an unparsable one is copied
         * to a backup next to it and replaced with defaults.
         *
         * @return false if the file could neither be read nor written.
         */
        bool load();

        /**
         * @brief Writes the cached state back to disk.
         */
        bool save();

        State& stateCache();
        State const& stateCache() const;

        std::filesystem::path const& path() const;

        /**
         * @brief $XDG_CONFIG_HOME/twinpane/config.json, falling back to ~/.config/twinpane/config.json.
         */
        static std::optional<std::filesystem::path> defaultPath();

      private:
        void dataFixer(nlohmann::json const& before);
        void makeBackup() const;

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
