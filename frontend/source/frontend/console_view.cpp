#include <frontend/console_view.hpp>
#include <log/log.hpp>
#include <utility/format_units.hpp>

#include <fmt/format.h>

#include <istream>
#include <ostream>

namespace
{
    void renderPane(std::string_view name, FileCommander::PaneView const& pane, std::ostream& output)
    {
        output << fmt::format("== {}: {}\n", name, pane.directory.generic_string());
        for (std::size_t i = 0; i != pane.entries.size(); ++i)
        {
            char const* marker = pane.selectedIndex && *pane.selectedIndex == i ? ">> " : "   ";
            output << marker << pane.entries[i] << '\n';
        }
        if (pane.entries.empty())
            output << "   (empty)\n";
    }

    std::string_view severityPrefix(StatusMessages::Severity severity)
    {
        switch (severity)
        {
            case StatusMessages::Severity::Warning:
                return "! ";
            case StatusMessages::Severity::Error:
                return "!! ";
            default:
                return "";
        }
    }
}

ConsoleView::ConsoleView(FileCommander& commander, std::istream& input, std::ostream& output)
    : commander_{&commander}
    , input_{&input}
    , output_{&output}
{}

void ConsoleView::run()
{
    render();
    std::string line;
    while (commander_->isAlive())
    {
        if (!std::getline(*input_, line))
        {
            Log::info("ConsoleView: Input closed, quitting.");
            commander_->requestQuit(true);
            break;
        }
        apply(line);
        commander_->tick();
        if (commander_->isAlive())
            render();
    }
}

void ConsoleView::apply(std::string_view commands)
{
    for (auto const command : commands)
    {
        if (!commander_->isAlive())
            return;

        switch (command)
        {
            case 'j':
                commander_->moveCursor(1);
                break;
            case 'k':
                commander_->moveCursor(-1);
                break;
            case 'h':
            case 'l':
                commander_->togglePane();
                break;
            case 'o':
                commander_->enterSelected();
                break;
            case 't':
                commander_->transferSelected();
                break;
            case '.':
                commander_->toggleHiddenFiles();
                break;
            case 'r':
                commander_->refresh();
                break;
            case 'q':
                commander_->requestQuit(false);
                break;
            case 'Q':
                commander_->requestQuit(true);
                break;
            case '?':
                *output_ << helpLine() << '\n';
                break;
            default:
                break;
        }
    }
}

void ConsoleView::render()
{
    renderView(commander_->view(), *output_);
    *output_ << "> " << std::flush;
}

void ConsoleView::renderView(FileCommander::View const& view, std::ostream& output)
{
    renderPane("Local", view.local, output);
    renderPane("Remote", view.remote, output);
    if (view.showHiddenFiles)
        output << "(hidden files shown)\n";
    for (auto const& meter : view.meters)
        output << formatMeter(meter) << '\n';
    for (auto const& message : view.messages)
        output << severityPrefix(message.severity) << message.text << '\n';
}

std::string ConsoleView::formatMeter(FileCommander::MeterView const& meter)
{
    if (meter.kind == ProgressMeter::Kind::DirectoryAggregate)
    {
        return fmt::format(
            "{}  {}  {} {}",
            meter.title,
            Utility::formatBytes(meter.bytesSent),
            meter.filesCompleted,
            meter.filesCompleted == 1 ? "File" : "Files");
    }

    std::string eta = "??:??";
    if (meter.eta)
        eta = Utility::formatDuration(std::chrono::duration_cast<std::chrono::seconds>(*meter.eta));

    return fmt::format(
        "{}  {}/{}  {}  {} ETA",
        meter.title,
        Utility::formatBytes(meter.bytesSent),
        Utility::formatBytes(meter.totalBytes),
        Utility::formatBitrate(meter.throughputBitsPerSecond),
        eta);
}

std::string ConsoleView::helpLine()
{
    return "j/k: move, h/l: switch pane, o: enter, t: transfer, .: hidden files, r: refresh, q: quit, Q: force quit";
}
