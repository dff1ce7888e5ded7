#pragma once

#include <filesystem>

#include "common/models.hpp"

namespace hashprint {

// Name of the marker file build-cache tooling drops into directories that
// must not be traversed or backed up (https://bford.info/cachedir/).
inline constexpr const char *kCacheMarkerName = "CACHEDIR.TAG";

/**
 * Build a snapshot of every regular file strictly inside root:
 * - subtrees whose directory name starts with '.' or that contain
 *   CACHEDIR.TAG are pruned, hidden files are skipped
 * - symbolic links are neither followed nor hashed
 * - each file is streamed through SHA-256 and its mtime captured
 *
 * Throws HashprintError(ErrorKind::Io) on the first file that cannot be
 * opened, read or stat-ed; no partial snapshot is ever returned. Nothing is
 * persisted.
 */
Snapshot computeSnapshot(const std::filesystem::path &root);

// Hash one file and capture its mtime.
Entry hashFile(const std::filesystem::path &path);

} // namespace hashprint
