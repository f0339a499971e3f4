#pragma once

#include <frontend/console_view.hpp>
#include <backend/file_system/local_file_system.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using namespace std::chrono_literals;

namespace Test
{
    namespace
    {
        FileCommander::MeterView fileMeter(std::uint64_t sent, std::uint64_t total)
        {
            return FileCommander::MeterView{
                .title = "Uploading \"a.txt\"",
                .kind = ProgressMeter::Kind::File,
                .ratio = 0.,
                .bytesSent = sent,
                .totalBytes = total,
                .throughputBitsPerSecond = 0,
                .eta = std::nullopt,
                .finished = false,
                .filesCompleted = 0,
            };
        }
    }

    TEST(ConsoleViewFormatTests, FileMeterWithoutEstimate)
    {
        EXPECT_EQ(ConsoleView::formatMeter(fileMeter(0, 100)), "Uploading \"a.txt\"  0 B/100 B  0 bit/s  ??:?? ETA");
    }

    TEST(ConsoleViewFormatTests, FileMeterWithEstimate)
    {
        auto meter = fileMeter(0, 1'000'000);
        meter.throughputBitsPerSecond = 131'072;
        meter.eta = 61'035ms;
        EXPECT_EQ(ConsoleView::formatMeter(meter), "Uploading \"a.txt\"  0 B/1.0 MB  131.1 Kbit/s  01:01 ETA");
    }

    TEST(ConsoleViewFormatTests, AggregateMeterCountsFiles)
    {
        FileCommander::MeterView meter{
            .title = "Downloading \"dir\"",
            .kind = ProgressMeter::Kind::DirectoryAggregate,
            .ratio = 0.,
            .bytesSent = 6912,
            .totalBytes = 0,
            .throughputBitsPerSecond = 0,
            .eta = std::nullopt,
            .finished = false,
            .filesCompleted = 2,
        };
        EXPECT_EQ(ConsoleView::formatMeter(meter), "Downloading \"dir\"  6.9 KB  2 Files");

        meter.filesCompleted = 1;
        meter.bytesSent = 9876;
        EXPECT_EQ(ConsoleView::formatMeter(meter), "Downloading \"dir\"  9.9 KB  1 File");
    }

    TEST(ConsoleViewFormatTests, SelectedEntryIsMarked)
    {
        FileCommander::View view{
            .local = {.directory = "/home/alice", .entries = {"..", "a.txt"}, .selectedIndex = std::nullopt},
            .remote = {.directory = "/srv", .entries = {"..", "data/"}, .selectedIndex = 1},
            .meters = {},
            .messages = {{.time = {}, .severity = StatusMessages::Severity::Info, .text = "No file selected."}},
            .showHiddenFiles = false,
        };

        std::stringstream output;
        ConsoleView::renderView(view, output);
        EXPECT_EQ(
            output.str(),
            "== Local: /home/alice\n"
            "   ..\n"
            "   a.txt\n"
            "== Remote: /srv\n"
            "   ..\n"
            ">> data/\n"
            "No file selected.\n");
    }

    class ConsoleViewTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            std::filesystem::create_directories(localDirectory_);
            std::filesystem::create_directories(remoteDirectory_);
            std::ofstream{localDirectory_ / "a.txt"} << "a";
            std::ofstream{localDirectory_ / "b.txt"} << "b";

            commander_ = std::make_unique<FileCommander>(
                std::make_unique<LocalFileSystem>(), std::make_unique<LocalFileSystem>(), FileCommanderOptions{});
            ASSERT_TRUE(commander_->open(localDirectory_, remoteDirectory_).has_value());
        }

        Utility::TemporaryDirectory isolateDirectory_{};
        std::filesystem::path localDirectory_{isolateDirectory_.path() / "local"};
        std::filesystem::path remoteDirectory_{isolateDirectory_.path() / "remote"};
        std::unique_ptr<FileCommander> commander_{};
    };

    TEST_F(ConsoleViewTests, CommandsOfALineAreAppliedInOrder)
    {
        std::stringstream input;
        std::stringstream output;
        ConsoleView view{*commander_, input, output};

        view.apply("jj k");
        EXPECT_EQ(commander_->view().local.selectedIndex, std::optional<std::size_t>{1});

        view.apply("l");
        EXPECT_EQ(commander_->view().local.selectedIndex, std::nullopt);
        EXPECT_EQ(commander_->view().remote.selectedIndex, std::optional<std::size_t>{0});
    }

    TEST_F(ConsoleViewTests, CommandsAfterQuitAreIgnored)
    {
        std::stringstream input;
        std::stringstream output;
        ConsoleView view{*commander_, input, output};

        view.apply("qj");
        EXPECT_FALSE(commander_->isAlive());
        EXPECT_EQ(commander_->view().local.selectedIndex, std::optional<std::size_t>{0});
    }

    TEST_F(ConsoleViewTests, RunEndsWhenInputCloses)
    {
        std::stringstream input{"j\n"};
        std::stringstream output;
        ConsoleView view{*commander_, input, output};

        view.run();
        EXPECT_FALSE(commander_->isAlive());
        EXPECT_NE(output.str().find(">> a.txt"), std::string::npos);
    }
}
