#pragma once

#include <ssh/session_backend.hpp>

#include <gmock/gmock.h>

namespace SecureShell::Test
{
    class SessionBackendMock : public ISessionBackend
    {
      public:
        MOCK_METHOD(
            (std::expected<void, std::string>),
            connect,
            (std::string const&, std::optional<std::uint16_t>, std::string const&, TransportOptions const&),
            (override));
        MOCK_METHOD(std::uint16_t, connectedPort, (), (const, override));
        MOCK_METHOD((std::expected<HostKey, std::string>), serverHostKey, (), (override));
        MOCK_METHOD(AuthenticationMethods, authenticationMethods, (), (override));
        MOCK_METHOD(bool, authenticateWithAgent, (), (override));
        MOCK_METHOD(bool, authenticateWithPublicKeyAuto, (), (override));
        MOCK_METHOD(bool, authenticateWithPassword, (std::string const&), (override));
        MOCK_METHOD(bool, isAuthenticated, (), (const, override));
    };
}
