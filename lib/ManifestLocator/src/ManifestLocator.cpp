#include "ManifestLocator/ManifestLocator.hpp"
#include "DirectoryWalker/DirectoryWalker.hpp"
#include "SwayConstants/SwayConstants.hpp"

std::optional<fs::path> FindNestedManifestDir(const fs::path& starterPath)
{
    return FindNestedDirWithFile(starterPath, ManifestFileName);
}

std::optional<fs::path> FindNestedDirWithFile(const fs::path& starterPath, const std::string& fileName)
{
    std::error_code errorCode;
    const fs::file_status starterStatus = fs::status(starterPath, errorCode);
    if ((0 != errorCode.value()) || (false == fs::exists(starterStatus)))
    {
        return std::nullopt;
    }

    fs::path starterDirectory = (true == fs::is_directory(starterStatus)) ? starterPath : starterPath.parent_path();
    if (true == starterDirectory.empty())
    {
        starterDirectory = ".";
    }

    const fs::path ownFile = starterDirectory / fileName;
    std::optional<fs::path> foundDirectory;

    // Linked directories are reported but not entered, a link cycle would never end
    DirectoryWalker walker(SymlinkPolicy::Skip);
    walker.Walk(starterDirectory,
                [&](const DirectoryEntry& entry)
                {
                    if ((entry.path.filename().string() != fileName) || (entry.path == ownFile))
                    {
                        return true;
                    }
                    foundDirectory = entry.path.parent_path();
                    return false;
                });

    return foundDirectory;
}

std::optional<fs::path> FindParentDirWithFile(const fs::path& starterPath, const std::string& fileName)
{
    std::error_code errorCode;
    fs::path currentPath = fs::canonical(starterPath, errorCode);
    if (0 != errorCode.value())
    {
        return std::nullopt;
    }

    // The root itself is never checked, the walk ends once it is reached
    while (currentPath != currentPath.root_path())
    {
        errorCode.clear();
        const bool fileExists = fs::exists(currentPath / fileName, errorCode);
        if ((0 == errorCode.value()) && (true == fileExists))
        {
            return currentPath;
        }
        currentPath = currentPath.parent_path();
    }

    return std::nullopt;
}

std::optional<fs::path> FindParentManifestDir(const fs::path& starterPath)
{
    return FindParentDirWithFile(starterPath, ManifestFileName);
}

std::optional<fs::path> FindParentManifestDirWithCheck(const fs::path& starterPath, const ManifestDirCheck& check)
{
    std::optional<fs::path> manifestDirectory = FindParentManifestDir(starterPath);

    while (true == manifestDirectory.has_value())
    {
        if (true == check(manifestDirectory.value()))
        {
            return manifestDirectory;
        }

        const fs::path parentDirectory = manifestDirectory.value().parent_path();
        if ((true == parentDirectory.empty()) || (parentDirectory == manifestDirectory.value()))
        {
            return std::nullopt;
        }
        manifestDirectory = FindParentManifestDir(parentDirectory);
    }

    return std::nullopt;
}

std::optional<fs::path> FindParentLockFile(const fs::path& starterPath)
{
    const std::optional<fs::path> manifestDirectory = FindParentManifestDir(starterPath);
    if (false == manifestDirectory.has_value())
    {
        return std::nullopt;
    }

    const fs::path lockFile = manifestDirectory.value() / LockFileName;
    std::error_code errorCode;
    const bool isRegularFile = fs::is_regular_file(lockFile, errorCode);
    if ((0 != errorCode.value()) || (false == isRegularFile))
    {
        return std::nullopt;
    }
    return lockFile;
}
