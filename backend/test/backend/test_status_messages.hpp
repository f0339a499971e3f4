#pragma once

#include <backend/status_messages.hpp>

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;

namespace Test
{
    TEST(StatusMessagesTests, MessagesAreKeptInOrder)
    {
        StatusMessages messages{};
        const auto now = StatusMessages::Clock::now();
        messages.push(StatusMessages::Severity::Info, "one", now);
        messages.push(StatusMessages::Severity::Error, "two", now);

        const auto current = messages.current(now);
        ASSERT_EQ(current.size(), 2u);
        EXPECT_EQ(current[0].text, "one");
        EXPECT_EQ(current[1].text, "two");
        EXPECT_EQ(current[1].severity, StatusMessages::Severity::Error);
    }

    TEST(StatusMessagesTests, QueueIsBounded)
    {
        StatusMessages messages{};
        const auto now = StatusMessages::Clock::now();
        for (int i = 0; i != 8; ++i)
            messages.push(StatusMessages::Severity::Info, std::to_string(i), now);

        const auto current = messages.current(now);
        ASSERT_EQ(current.size(), StatusMessages::maximumMessages - 1);
        EXPECT_EQ(current.front().text, "4");
        EXPECT_EQ(current.back().text, "7");
    }

    TEST(StatusMessagesTests, OldMessagesExpire)
    {
        StatusMessages messages{};
        const auto now = StatusMessages::Clock::now();
        messages.push(StatusMessages::Severity::Warning, "old", now);
        messages.push(StatusMessages::Severity::Info, "new", now + 8s);

        const auto current = messages.current(now + 11s);
        ASSERT_EQ(current.size(), 1u);
        EXPECT_EQ(current.front().text, "new");
    }
}
