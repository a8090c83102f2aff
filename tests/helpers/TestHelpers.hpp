#pragma once

#include "gtest/gtest.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;

/**
 * @brief Check whether permission bits on directories are enforced for the running user.
 *
 * Root bypasses them on POSIX systems, Windows does not map them onto directory reads.
 *
 * @return true if a directory with no permissions cannot be listed
 */
inline bool DirectoryPermissionsEnforced()
{
#ifdef _WIN32
    return false;
#else
    return 0 != geteuid();
#endif
}

/**
 * @brief Normalize path separators to forward slashes for cross-platform testing.
 *
 * @param[in] paths Vector of path strings to normalize
 * @return Vector of normalized path strings
 */
inline std::vector<std::string> NormalizePaths(const std::vector<std::string>& paths)
{
    std::vector<std::string> normalizedPaths;
    for (const auto& path : paths)
    {
        std::string normalizedPath = path;
        std::replace(normalizedPath.begin(), normalizedPath.end(), '\\', '/');
        normalizedPaths.push_back(normalizedPath);
    }
    return normalizedPaths;
}

/**
 * @brief Express paths relative to a base directory as sorted, normalized strings.
 *
 * @param[in] paths Paths located under the base directory
 * @param[in] baseDirectory Directory the result is relative to
 * @return Sorted vector of normalized relative paths
 */
inline std::vector<std::string> RelativePaths(const std::vector<fs::path>& paths, const fs::path& baseDirectory)
{
    std::vector<std::string> contents;
    for (const auto& path : paths)
    {
        contents.push_back(path.lexically_relative(baseDirectory).string());
    }
    std::sort(contents.begin(), contents.end());
    return NormalizePaths(contents);
}

/**
 * @brief Fixture owning a scratch directory tree named after the running test.
 *
 * The tree is rooted at a canonical path so results of canonicalizing searches compare equal.
 */
class ScratchTreeTest : public ::testing::Test
{
  protected:
    fs::path root;

    void SetUp() override
    {
        const auto* const testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string testName = std::string(testInfo->test_suite_name()) + "_" + testInfo->name();

        const fs::path scratch = fs::temp_directory_path() / ("sway_locate_" + testName);

        // Clean up from previous runs if they failed
        fs::remove_all(scratch);
        fs::create_directories(scratch);

        root = fs::canonical(scratch);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(root, ec);
    }

    /** Create a file, creating missing parent directories first. */
    void CreateFile(const fs::path& path, const std::string& content = "")
    {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    /** Remove every permission from a directory so it cannot be listed. */
    void LockDirectory(const fs::path& path)
    {
        fs::permissions(path, fs::perms::none);
    }

    /** Restore owner permissions on a locked directory. */
    void UnlockDirectory(const fs::path& path)
    {
        fs::permissions(path, fs::perms::owner_all);
    }

    /** Create a directory, creating missing parents first. */
    void CreateDirectory(const fs::path& path)
    {
        fs::create_directories(path);
    }
};
