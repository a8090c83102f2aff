// file main.cpp:

#include "SwayLocate/SwayLocate.hpp"
#include "cxxopts.hpp"

#include <filesystem>
#include <iostream>
#include <optional>

namespace fs = std::filesystem;

namespace
{

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @return std::optional<cxxopts::ParseResult> if parsing is successful and help is not requested,
 *         otherwise returns an empty optional.
 * @throws cxxopts::exceptions::exception if the arguments cannot be parsed.
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[])
{
    cxxopts::Options options("sway-locate", "Sway project discovery");

    // clang-format off
    options.add_options()
        ("c,command",     "Search to run: files, parent-manifest, nested-manifest, parent-file, nested-file",
                          cxxopts::value<std::string>()->default_value("parent-manifest"))
        ("p,path",        "Path to start the search from", cxxopts::value<std::string>()->default_value("."))
        ("f,file",        "File name for parent-file and nested-file", cxxopts::value<std::string>())
        ("s,require-src", "Only accept parent manifests with a src directory")
        ("v,verbose",     "Verbose output")
        ("h,help",        "Print help");
    // clang-format on

    auto parseResult = options.parse(argc, argv);

    if (true == parseResult.count("help"))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    return parseResult;
}

/**
 * @brief Sets up the LocateConfig based on parsed command-line options.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return std::optional<LocateConfig> if configuration is valid, otherwise an empty optional.
 */
std::optional<LocateConfig> SetupLocateConfiguration(const cxxopts::ParseResult& parseResult)
{
    LocateConfig config;

    const std::optional<LocateCommand> command = StringToLocateCommand(parseResult["command"].as<std::string>());
    if (false == command.has_value())
    {
        std::cerr << "Unknown command: " << parseResult["command"].as<std::string>() << '\n';
        return std::nullopt;
    }

    config.command = command.value();
    config.startPath = fs::path(parseResult["path"].as<std::string>());
    config.requireSources = (0 < parseResult.count("require-src"));
    config.verbose = (0 < parseResult.count("verbose"));

    if (0 < parseResult.count("file"))
    {
        config.fileName = parseResult["file"].as<std::string>();
    }

    if (((LocateCommand::ParentFile == config.command) || (LocateCommand::NestedFile == config.command)) &&
        (true == config.fileName.empty()))
    {
        std::cerr << "Command " << LocateCommandToString(config.command) << " requires --file\n";
        return std::nullopt;
    }

    if (true == config.verbose)
    {
        config.onProgress = [](const LocateProgress& progress)
        { std::cout << "[" << progress.stage << "] " << progress.found << " : " << progress.path.string() << '\n'; };
    }

    return config;
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<cxxopts::ParseResult> parseResult;
    std::optional<LocateConfig> locateConfiguration;

    try
    {
        parseResult = ParseCommandLineOptions(argc, argv);
        if (false == parseResult.has_value())
        {
            return 0; // Help was shown, exit gracefully.
        }

        locateConfiguration = SetupLocateConfiguration(parseResult.value());
    }
    catch (const cxxopts::exceptions::exception& exception)
    {
        std::cerr << "Invalid arguments: " << exception.what() << '\n';
        return 1;
    }

    if (false == locateConfiguration.has_value())
    {
        return 1; // Configuration failed, error message already printed.
    }

    if (false == RunLocate(locateConfiguration.value(), std::cout))
    {
        if (true == locateConfiguration.value().verbose)
        {
            std::cerr << "Nothing found\n";
        }
        return 1;
    }

    return 0;
}
