#include "DirectoryWalker/DirectoryWalker.hpp"

#include <utility>
#include <vector>

DirectoryWalker::DirectoryWalker(SymlinkPolicy symlinkPolicy)
    : _symlinkPolicy(symlinkPolicy)
{
}

bool DirectoryWalker::Walk(const std::filesystem::path& root,
                           const std::function<bool(const DirectoryEntry&)>& onEntry) const
{
    std::vector<fs::path> pendingDirectories{root};

    while (false == pendingDirectories.empty())
    {
        const fs::path currentDirectory = std::move(pendingDirectories.back());
        pendingDirectories.pop_back();

        std::error_code errorCode;
        fs::directory_iterator iterator(currentDirectory, errorCode);
        if (0 != errorCode.value())
        {
            continue;
        }

        for (; iterator != fs::directory_iterator(); iterator.increment(errorCode))
        {
            if (0 != errorCode.value())
            {
                break;
            }

            std::error_code entryErrorCode;
            const bool isDirectory = iterator->is_directory(entryErrorCode);
            const bool entryIsDirectory = (0 == entryErrorCode.value()) && (true == isDirectory);

            entryErrorCode.clear();
            const bool isSymlink = iterator->is_symlink(entryErrorCode);
            const DirectoryEntry entry{iterator->path(), entryIsDirectory, (0 == entryErrorCode.value()) && (true == isSymlink)};

            if (false == onEntry(entry))
            {
                return false;
            }

            const bool descend = (SymlinkPolicy::Follow == _symlinkPolicy) || (false == entry.isSymlink);
            if ((true == entry.isDirectory) && (true == descend))
            {
                pendingDirectories.push_back(entry.path);
            }
        }
    }

    return true;
}
