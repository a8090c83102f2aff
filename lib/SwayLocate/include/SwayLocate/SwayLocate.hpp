// file SwayLocate.hpp:

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Enumeration of the searches the locate tool can run.
 */
enum class LocateCommand
{
    Files,           /**< Collect Sway source files below the start path */
    ParentManifest,  /**< Nearest manifest directory above the start path */
    NestedManifest,  /**< Manifest directory nested below the start path */
    ParentFile,      /**< Nearest directory above the start path holding a named file */
    NestedFile       /**< Directory nested below the start path holding a named file */
};

/**
 * @brief Convert a LocateCommand enumeration value to its command-line name.
 *
 * @param[in] command The command to convert
 * @return Command-line name of the command
 */
inline const char* LocateCommandToString(LocateCommand command)
{
    switch (command)
    {
    case LocateCommand::Files:
        return "files";
    case LocateCommand::ParentManifest:
        return "parent-manifest";
    case LocateCommand::NestedManifest:
        return "nested-manifest";
    case LocateCommand::ParentFile:
        return "parent-file";
    case LocateCommand::NestedFile:
        return "nested-file";
    }
    return "unknown";
}

/**
 * @brief Convert a command-line name to its LocateCommand enumeration value.
 *
 * @param[in] stringValue The name to convert
 * @return Matching command, std::nullopt if the name is not recognized
 */
inline std::optional<LocateCommand> StringToLocateCommand(const std::string& stringValue)
{
    if ("files" == stringValue)
    {
        return LocateCommand::Files;
    }
    if ("parent-manifest" == stringValue)
    {
        return LocateCommand::ParentManifest;
    }
    if ("nested-manifest" == stringValue)
    {
        return LocateCommand::NestedManifest;
    }
    if ("parent-file" == stringValue)
    {
        return LocateCommand::ParentFile;
    }
    if ("nested-file" == stringValue)
    {
        return LocateCommand::NestedFile;
    }
    return std::nullopt;
}

/**
 * @brief Progress information for locate operations.
 */
struct LocateProgress
{
    const char* stage;          /**< Current stage of the search */
    std::size_t found;          /**< Number of results found so far */
    fs::path path;              /**< Path the stage refers to */
};

/**
 * @brief Configuration parameters for locate operations.
 */
struct LocateConfig
{
    LocateCommand command;      /**< Search to run */
    fs::path startPath;         /**< Path the search starts from */
    std::string fileName;       /**< File to look for, used by ParentFile and NestedFile */
    bool requireSources;        /**< ParentManifest only: skip manifest directories without a source directory */

    bool verbose;               /**< Enable verbose progress output */

    std::function<void(const LocateProgress&)> onProgress;  /**< Optional callback for progress notifications */

    /**
     * @brief Initialize configuration with default values.
     */
    LocateConfig()
        : command(LocateCommand::ParentManifest)
        , requireSources(false)
        , verbose(false)
        , onProgress(nullptr)
    {
    }
};

/**
 * @brief Run the search described by the configuration and print its results.
 *
 * Each result is written on its own line. Collected files are written in
 * sorted order.
 *
 * @param[in] configuration Configuration parameters for the search
 * @param[out] output Stream receiving the result paths
 * @return true if at least one result was found, false otherwise
 */
bool RunLocate(const LocateConfig& configuration, std::ostream& output);
