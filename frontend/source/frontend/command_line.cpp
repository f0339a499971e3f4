#include <frontend/command_line.hpp>

#include <boost/program_options.hpp>

#include <sstream>

namespace po = boost::program_options;

namespace
{
    po::options_description visibleOptions()
    {
        po::options_description options{"Options"};
        // clang-format off
        options.add_options()
            ("help,h", "Show this help.")
            ("port,p", po::value<std::string>(), "Port of the ssh server, 22 if omitted.")
            ("user,u", po::value<std::string>(), "User to log in as.")
            ("config", po::value<std::string>(), "Configuration file to use instead of the default one.")
            ("show-hidden", po::bool_switch(), "Start with hidden files shown.")
            ("log-level", po::value<std::string>(), "trace, debug, info, warning, error, critical or off.")
            ("log-file", po::value<std::string>(), "File to append the log to.");
        // clang-format on
        return options;
    }
}

std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char const* const* argv)
{
    po::options_description hidden;
    hidden.add_options()("destination", po::value<std::string>(), "Host to connect to.");

    po::options_description all;
    all.add(visibleOptions()).add(hidden);

    po::positional_options_description positional;
    positional.add("destination", 1);

    po::variables_map variables;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), variables);
        po::notify(variables);
    }
    catch (po::error const& exc)
    {
        return std::unexpected(std::string{exc.what()});
    }

    CommandLineOptions options{};
    if (variables.count("help"))
    {
        options.helpRequested = true;
        return options;
    }

    if (!variables.count("destination"))
        return std::unexpected(std::string{"the destination is missing"});
    if (!variables.count("user"))
        return std::unexpected(std::string{"the option '--user' is required but missing"});

    options.destination = variables["destination"].as<std::string>();
    options.user = variables["user"].as<std::string>();
    if (variables.count("port"))
        options.port = variables["port"].as<std::string>();
    if (variables.count("config"))
        options.configFile = variables["config"].as<std::string>();
    if (variables["show-hidden"].as<bool>())
        options.showHiddenFiles = true;
    if (variables.count("log-level"))
    {
        auto const name = variables["log-level"].as<std::string>();
        options.logLevel = Log::parseLevel(name);
        if (!options.logLevel)
            return std::unexpected("unknown log level '" + name + "'");
    }
    if (variables.count("log-file"))
        options.logFile = variables["log-file"].as<std::string>();
    return options;
}

std::string commandLineUsage()
{
    std::stringstream stream;
    stream << "Usage: twinpane [options] -u <user> <destination>\n\n" << visibleOptions();
    return stream.str();
}
