#pragma once

#include <backend/progress/progress_meter.hpp>
#include <backend/progress/progress_registry.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace Test
{
    TEST(ProgressMeterTests, RecordingAllBytesCompletesRatio)
    {
        ProgressMeter meter{"Uploading \"a\"", 100};
        EXPECT_DOUBLE_EQ(meter.ratio(), 0.0);
        meter.record(100);
        EXPECT_DOUBLE_EQ(meter.ratio(), 1.0);
        EXPECT_FALSE(meter.isFinished());
    }

    TEST(ProgressMeterTests, FinishWithoutBytesCompletesRatio)
    {
        ProgressMeter meter{"Uploading \"a\"", 100};
        meter.finish();
        EXPECT_DOUBLE_EQ(meter.ratio(), 1.0);
        EXPECT_TRUE(meter.isFinished());
        EXPECT_EQ(meter.bytesSent(), 100u);
    }

    TEST(ProgressMeterTests, RatioIsZeroForEmptyTotal)
    {
        ProgressMeter meter{"Uploading \"empty\"", 0};
        meter.record(10);
        EXPECT_DOUBLE_EQ(meter.ratio(), 0.0);
    }

    TEST(ProgressMeterTests, RatioNeverExceedsOne)
    {
        ProgressMeter meter{"Downloading \"a\"", 10};
        meter.record(15);
        EXPECT_DOUBLE_EQ(meter.ratio(), 1.0);
        EXPECT_EQ(meter.eta(), std::nullopt);
    }

    TEST(ProgressMeterTests, ThroughputWindowYieldsPositiveFiniteEta)
    {
        const auto start = ProgressMeter::Clock::now();
        ProgressMeter meter{"Uploading \"big\"", 1'000'000, start};
        for (auto offset : {0ms, 250ms, 500ms, 750ms, 1000ms})
            meter.record(4096, start + offset);

        EXPECT_EQ(meter.throughputBitsPerSecond(), 5u * 4096u * 8u);
        const auto eta = meter.eta();
        ASSERT_TRUE(eta.has_value());
        EXPECT_GT(eta->count(), 0);
        EXPECT_LT(*eta, std::chrono::hours{1});
    }

    TEST(ProgressMeterTests, OldSamplesLeaveTheWindow)
    {
        const auto start = ProgressMeter::Clock::now();
        ProgressMeter meter{"Uploading \"big\"", 1'000'000, start};
        meter.record(1000, start + 1s);
        meter.record(1000, start + 7s);
        meter.record(1000, start + 8s);

        // Only the samples at 7s and 8s remain.
        EXPECT_EQ(meter.throughputBitsPerSecond(), 2000u * 8u);
        EXPECT_EQ(meter.bytesSent(), 3000u);
    }

    TEST(ProgressMeterTests, NoThroughputWithoutElapsedTime)
    {
        const auto start = ProgressMeter::Clock::now();
        ProgressMeter meter{"Uploading \"a\"", 100, start};
        meter.record(10, start);
        EXPECT_EQ(meter.throughputBitsPerSecond(), 0u);
        EXPECT_EQ(meter.eta(), std::nullopt);
    }

    TEST(ProgressMeterTests, FinishedMeterHasZeroEtaAndNoHistory)
    {
        const auto start = ProgressMeter::Clock::now();
        ProgressMeter meter{"Uploading \"a\"", 100, start};
        meter.record(10, start + 1s);
        meter.finish();
        meter.finish();
        EXPECT_EQ(meter.eta(), std::optional<std::chrono::milliseconds>{0ms});
        EXPECT_EQ(meter.throughputBitsPerSecond(), 0u);
        EXPECT_EQ(meter.bytesSent(), 100u);
    }

    TEST(ProgressMeterTests, DirectoryMeterCountsFiles)
    {
        auto meter = ProgressMeter::directory("Uploading \"dir\"");
        meter->addCompletedFile(10);
        meter->addCompletedFile(20);
        EXPECT_EQ(meter->kind(), ProgressMeter::Kind::DirectoryAggregate);
        EXPECT_EQ(meter->filesCompleted(), 2u);
        EXPECT_EQ(meter->bytesSent(), 30u);
        EXPECT_DOUBLE_EQ(meter->ratio(), 0.0);

        meter->finish();
        EXPECT_TRUE(meter->isFinished());
        EXPECT_EQ(meter->bytesSent(), 30u);
    }

    TEST(ProgressMeterTests, ConcurrentRecordsAreAllCounted)
    {
        ProgressMeter meter{"Uploading \"a\"", 4000};
        std::vector<std::thread> writers;
        for (int i = 0; i != 4; ++i)
        {
            writers.emplace_back([&meter]() {
                for (int j = 0; j != 1000; ++j)
                    meter.record(1);
            });
        }
        for (int j = 0; j != 100; ++j)
        {
            [[maybe_unused]] const auto throughput = meter.throughputBitsPerSecond();
            [[maybe_unused]] const auto ratio = meter.ratio();
        }
        for (auto& writer : writers)
            writer.join();
        EXPECT_EQ(meter.bytesSent(), 4000u);
    }

    TEST(ProgressRegistryTests, PruneRemovesOnlyFinishedMeters)
    {
        ProgressRegistry registry{};
        auto running = std::make_shared<ProgressMeter>("Uploading \"a\"", 10);
        auto done = std::make_shared<ProgressMeter>("Uploading \"b\"", 10);
        registry.add(running);
        registry.add(done);
        EXPECT_EQ(registry.size(), 2u);

        done->finish();
        EXPECT_EQ(registry.prune(), 1u);
        ASSERT_EQ(registry.size(), 1u);
        EXPECT_EQ(registry.snapshot().front(), running);

        running->finish();
        registry.prune();
        EXPECT_TRUE(registry.empty());
    }

    TEST(ProgressRegistryTests, SnapshotOutlivesPrune)
    {
        ProgressRegistry registry{};
        auto meter = std::make_shared<ProgressMeter>("Uploading \"a\"", 10);
        registry.add(meter);

        const auto snapshot = registry.snapshot();
        meter->finish();
        registry.prune();

        ASSERT_EQ(snapshot.size(), 1u);
        EXPECT_TRUE(snapshot.front()->isFinished());
    }
}
