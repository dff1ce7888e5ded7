#pragma once

#include <filesystem>

#include "common/models.hpp"
#include "core/state_store.hpp"

namespace hashprint {

/**
 * Reconciler rewinds the mtime of files whose mtime advanced since the last
 * recorded run while their content stayed the same:
 * - hashes the root into a live snapshot
 * - on the first run, persists the live snapshot as the baseline
 * - otherwise restores the stored mtime of every touched-but-unchanged file
 *   and persists the live snapshot with those stored entries merged in
 *
 * The first error aborts the run. Rewinds applied before the error stay in
 * place and the previous state file is left as it was.
 */
class Reconciler
{
public:
    explicit Reconciler(const StateStore &store = StateStore());

    // In dry-run mode no mtime is changed and the state file is not rewritten,
    // but the summary still lists what would have been rewound. The baseline
    // of a first run is written regardless.
    ReconcileSummary reconcile(const std::filesystem::path &root, bool dryRun);

private:
    StateStore m_store;
};

// Absolute, symlink-free form of root. Throws HashprintError(Io) when root is
// missing or not a directory.
std::filesystem::path normalizeRoot(const std::filesystem::path &root);

} // namespace hashprint
