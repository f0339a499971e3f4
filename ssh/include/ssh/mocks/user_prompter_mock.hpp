#pragma once

#include <ssh/user_prompter.hpp>

#include <gmock/gmock.h>

namespace SecureShell::Test
{
    class UserPrompterMock : public IUserPrompter
    {
      public:
        MOCK_METHOD(std::optional<std::string>, confirmHost, (std::string const&), (override));
        MOCK_METHOD(std::optional<std::string>, askPassword, (std::string const&), (override));
    };
}
