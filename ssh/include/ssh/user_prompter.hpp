#pragma once

#include <optional>
#include <string>

namespace SecureShell
{
    /**
     * @brief Asks the user during session establishment.
     * Both functions return std::nullopt when the user aborted the input.
     */
    class IUserPrompter
    {
      public:
        virtual ~IUserPrompter() = default;

        /**
         * @brief Shows the message and returns the free text answer.
         */
        virtual std::optional<std::string> confirmHost(std::string const& message) = 0;

        virtual std::optional<std::string> askPassword(std::string const& prompt) = 0;
    };
}
