#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Check whether a path names an existing regular file with the given extension.
 *
 * The comparison is case-sensitive and the extension is given without its leading dot.
 *
 * @param[in] path Path to test
 * @param[in] extension Expected extension, e.g. "sw"
 * @return true if the path is a regular file carrying the extension
 */
bool IsSourceFile(const fs::path& path, const std::string& extension);

/**
 * @brief Collect every regular file with the given extension below a root directory.
 *
 * Unreadable directories are skipped. The order of the result is unspecified.
 *
 * @param[in] root Directory to search
 * @param[in] extension Expected extension, e.g. "sw"
 * @return Paths of the matching files
 */
std::vector<fs::path> CollectSourceFiles(const fs::path& root, const std::string& extension);

/** Check whether a path names an existing Sway source file. */
bool IsSwayFile(const fs::path& path);

/** Collect every Sway source file below a root directory. */
std::vector<fs::path> GetSwayFiles(const fs::path& root);
