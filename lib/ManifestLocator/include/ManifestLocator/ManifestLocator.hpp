#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Extra condition a manifest directory must satisfy, e.g. a matching package name.
 */
using ManifestDirCheck = std::function<bool(const fs::path&)>;

/**
 * @brief Search down the file tree for a directory holding a package manifest.
 *
 * @param[in] starterPath Directory (or file inside the directory) to search from
 * @return Directory containing the first nested manifest, std::nullopt if none
 */
std::optional<fs::path> FindNestedManifestDir(const fs::path& starterPath);

/**
 * @brief Search down the file tree for a directory holding the given file.
 *
 * A file placed directly in the starting directory does not count, only
 * occurrences inside sub-directories are reported. If the starting path is a
 * file, its parent directory is searched; a missing starting path finds
 * nothing. Unreadable directories are skipped and linked directories are not
 * entered.
 * When several matches exist, which one is returned is unspecified.
 *
 * @param[in] starterPath Directory (or file inside the directory) to search from
 * @param[in] fileName Name of the entry to look for
 * @return Directory containing the match, std::nullopt if none
 */
std::optional<fs::path> FindNestedDirWithFile(const fs::path& starterPath, const std::string& fileName);

/**
 * @brief Search up the file tree for a directory holding the given file.
 *
 * The starting path is canonicalized first, then each ancestor is checked,
 * starting with the starting directory itself. The filesystem root is where
 * the walk stops.
 *
 * @param[in] starterPath Path to search from, must exist
 * @param[in] fileName Name of the file to look for
 * @return Nearest directory containing the file, std::nullopt if none or if the path cannot be canonicalized
 */
std::optional<fs::path> FindParentDirWithFile(const fs::path& starterPath, const std::string& fileName);

/**
 * @brief Search up the file tree for a directory holding a package manifest.
 *
 * @param[in] starterPath Path to search from, must exist
 * @return Nearest directory containing a manifest, std::nullopt if none
 */
std::optional<fs::path> FindParentManifestDir(const fs::path& starterPath);

/**
 * @brief Search up the file tree for a manifest directory accepted by a check.
 *
 * Manifest directories rejected by the check are skipped and the search goes
 * on from their parent.
 *
 * @param[in] starterPath Path to search from, must exist
 * @param[in] check Condition the manifest directory must satisfy
 * @return Nearest accepted manifest directory, std::nullopt if none
 */
std::optional<fs::path> FindParentManifestDirWithCheck(const fs::path& starterPath, const ManifestDirCheck& check);

/**
 * @brief Locate the lock file belonging to the nearest parent manifest.
 *
 * @param[in] starterPath Path to search from, must exist
 * @return Path of the lock file, std::nullopt if there is no parent manifest or it has no lock file
 */
std::optional<fs::path> FindParentLockFile(const fs::path& starterPath);
