#pragma once

#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

/**
 * @brief Entry reported while walking a directory tree.
 */
struct DirectoryEntry
{
    fs::path path;      /**< Path of the entry, rooted at the walk root */
    bool isDirectory;   /**< true if the entry names a directory, following symbolic links */
    bool isSymlink;     /**< true if the entry itself is a symbolic link */
};

/**
 * @brief How the walker treats symbolic links that point to directories.
 */
enum class SymlinkPolicy
{
    Follow,  /**< Descend into linked directories */
    Skip     /**< Report linked directories without descending into them */
};

/**
 * @brief Infrastructure component walking a directory tree with an explicit work-list.
 *
 * Directories that cannot be read are skipped, the rest of the tree is still visited.
 */
class DirectoryWalker
{
  public:
    /**
     * @brief Construct a walker.
     *
     * @param[in] symlinkPolicy Whether linked directories are descended into
     */
    explicit DirectoryWalker(SymlinkPolicy symlinkPolicy = SymlinkPolicy::Follow);

    /**
     * @brief Visit every entry below the provided root.
     *
     * The root itself is not reported. Sub-directories are reported before
     * their own entries are read.
     *
     * @param[in] root Directory to walk
     * @param[in] onEntry Callback invoked for each entry, returns false to stop the walk
     * @return true if the whole tree was visited, false if the callback stopped the walk
     */
    bool Walk(const fs::path& root, const std::function<bool(const DirectoryEntry&)>& onEntry) const;

  private:
    SymlinkPolicy _symlinkPolicy;
};
