#include "SourceFiles/SourceFiles.hpp"
#include "DirectoryWalker/DirectoryWalker.hpp"
#include "SwayConstants/SwayConstants.hpp"

bool IsSourceFile(const fs::path& path, const std::string& extension)
{
    std::error_code errorCode;
    const bool isRegularFile = fs::is_regular_file(path, errorCode);
    if ((0 != errorCode.value()) || (false == isRegularFile))
    {
        return false;
    }

    // fs::path::extension() keeps the dot, an empty extension means "no extension"
    const std::string pathExtension = path.extension().string();
    if (true == pathExtension.empty())
    {
        return false;
    }
    return pathExtension.substr(1) == extension;
}

std::vector<fs::path> CollectSourceFiles(const fs::path& root, const std::string& extension)
{
    std::vector<fs::path> files;

    DirectoryWalker walker;
    walker.Walk(root,
                [&](const DirectoryEntry& entry)
                {
                    if ((false == entry.isDirectory) && (true == IsSourceFile(entry.path, extension)))
                    {
                        files.push_back(entry.path);
                    }
                    return true;
                });

    return files;
}

bool IsSwayFile(const fs::path& path)
{
    return IsSourceFile(path, SwayExtension);
}

std::vector<fs::path> GetSwayFiles(const fs::path& root)
{
    return CollectSourceFiles(root, SwayExtension);
}
