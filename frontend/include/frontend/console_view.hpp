#pragma once

#include <backend/file_commander.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

/**
 * @brief Line oriented control loop. Every input line is a sequence of single character commands, the view is
 * drawn again after each line.
 */
class ConsoleView
{
  public:
    ConsoleView(FileCommander& commander, std::istream& input, std::ostream& output);

    /**
     * @brief Runs until the commander is no longer alive or the input is closed.
     */
    void run();

    /**
     * @brief Executes the commands of one line. Commands after a successful quit are ignored.
     */
    void apply(std::string_view commands);

    void render();

    static void renderView(FileCommander::View const& view, std::ostream& output);
    static std::string formatMeter(FileCommander::MeterView const& meter);
    static std::string helpLine();

  private:
    FileCommander* commander_;
    std::istream* input_;
    std::ostream* output_;
};
