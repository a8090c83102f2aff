#pragma once

/**
 * @brief Fixed names used to recognize Sway packages on disk.
 */

/** Extension of a Sway source file, without the leading dot */
inline constexpr char SwayExtension[] = "sw";

/** Reserved name of the file marking a package root */
inline constexpr char ManifestFileName[] = "Forc.toml";

/** Lock file written next to a package manifest */
inline constexpr char LockFileName[] = "Forc.lock";

/** Conventional directory holding a package's sources */
inline constexpr char SourceDirectoryName[] = "src";
