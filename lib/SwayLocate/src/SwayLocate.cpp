// file SwayLocate.cpp
#include "SwayLocate/SwayLocate.hpp"
#include "ManifestLocator/ManifestLocator.hpp"
#include "SourceFiles/SourceFiles.hpp"
#include "SwayConstants/SwayConstants.hpp"

#include <algorithm>
#include <vector>

namespace
{

/**
 * @brief Forward a progress notification when a callback is configured.
 */
void ReportProgress(const LocateConfig& config, const char* stage, std::size_t found, const fs::path& path)
{
    if (nullptr != config.onProgress)
    {
        config.onProgress({stage, found, path});
    }
}

/**
 * @brief Print a single optional directory result.
 *
 * @return true if the result was present
 */
bool WriteDirectoryResult(const LocateConfig& config, const std::optional<fs::path>& result, std::ostream& output)
{
    if (false == result.has_value())
    {
        ReportProgress(config, "not-found", 0, config.startPath);
        return false;
    }

    ReportProgress(config, "found", 1, result.value());
    output << result.value().string() << '\n';
    return true;
}

/**
 * @brief Check that a manifest directory carries a source directory next to its manifest.
 */
bool HasSourceDirectory(const fs::path& manifestDirectory)
{
    std::error_code errorCode;
    const bool isDirectory = fs::is_directory(manifestDirectory / SourceDirectoryName, errorCode);
    return (0 == errorCode.value()) && (true == isDirectory);
}

std::optional<fs::path> FindParentManifest(const LocateConfig& config)
{
    if (false == config.requireSources)
    {
        return FindParentManifestDir(config.startPath);
    }

    return FindParentManifestDirWithCheck(config.startPath,
                                          [&config](const fs::path& manifestDirectory)
                                          {
                                              const bool accepted = HasSourceDirectory(manifestDirectory);
                                              if (false == accepted)
                                              {
                                                  ReportProgress(config, "skipped", 0, manifestDirectory);
                                              }
                                              return accepted;
                                          });
}

bool RunCollectFiles(const LocateConfig& config, std::ostream& output)
{
    std::vector<fs::path> files = GetSwayFiles(config.startPath);
    std::sort(files.begin(), files.end());

    std::size_t writtenCount = 0;
    for (const auto& file : files)
    {
        ReportProgress(config, "collecting", ++writtenCount, file);
        output << file.string() << '\n';
    }

    return false == files.empty();
}

} // namespace

bool RunLocate(const LocateConfig& config, std::ostream& output)
{
    ReportProgress(config, LocateCommandToString(config.command), 0, config.startPath);

    switch (config.command)
    {
    case LocateCommand::Files:
        return RunCollectFiles(config, output);
    case LocateCommand::ParentManifest:
        return WriteDirectoryResult(config, FindParentManifest(config), output);
    case LocateCommand::NestedManifest:
        return WriteDirectoryResult(config, FindNestedManifestDir(config.startPath), output);
    case LocateCommand::ParentFile:
        if (true == config.fileName.empty())
        {
            return false;
        }
        return WriteDirectoryResult(config, FindParentDirWithFile(config.startPath, config.fileName), output);
    case LocateCommand::NestedFile:
        if (true == config.fileName.empty())
        {
            return false;
        }
        return WriteDirectoryResult(config, FindNestedDirWithFile(config.startPath, config.fileName), output);
    }
    return false;
}
