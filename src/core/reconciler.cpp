#include "core/reconciler.hpp"

#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/snapshot_builder.hpp"

namespace hashprint {

namespace {

namespace fs = std::filesystem;

void setMtime(const fs::path &path, fs::file_time_type mtime)
{
    std::error_code error;
    fs::last_write_time(path, mtime, error);
    if (error) {
        throw HashprintError(ErrorKind::Io,
                             "cannot set mtime of " + path.string() + ": " + error.message());
    }
}

std::size_t countMissing(const Snapshot &from, const Snapshot &in)
{
    std::size_t missing = 0;
    for (const auto &item : from.entries) {
        if (in.entries.find(item.first) == in.entries.end()) {
            ++missing;
        }
    }
    return missing;
}

} // namespace

fs::path normalizeRoot(const fs::path &root)
{
    std::error_code error;
    const fs::path canonical = fs::canonical(root, error);
    if (error) {
        throw HashprintError(ErrorKind::Io,
                             "cannot resolve root " + root.string() + ": " + error.message());
    }
    if (!fs::is_directory(canonical, error)) {
        throw HashprintError(ErrorKind::Io, canonical.string() + " is not a directory");
    }
    return canonical;
}

Reconciler::Reconciler(const StateStore &store)
    : m_store(store)
{
}

ReconcileSummary Reconciler::reconcile(const fs::path &requestedRoot, bool dryRun)
{
    const fs::path root = normalizeRoot(requestedRoot);

    ReconcileSummary summary;
    summary.root = root;
    summary.dryRun = dryRun;

    const Snapshot live = computeSnapshot(root);
    summary.filesHashed = live.entries.size();

    const std::optional<Snapshot> stored = m_store.load(root);
    if (!stored.has_value()) {
        HLOG_INFO("Reconciler", "baseline_write",
                  {{"root", root.string()},
                   {"files", live.entries.size()}});
        m_store.save(live);
        summary.firstRun = true;
        summary.stateSaved = true;
        summary.added = live.entries.size();
        return summary;
    }

    HLOG_INFO("Reconciler", "rewind_start",
              {{"root", root.string()},
               {"stored", stored->entries.size()},
               {"live", live.entries.size()}});

    std::map<fs::path, Entry> corrected;
    for (const auto &[path, storedEntry] : stored->entries) {
        const auto liveIt = live.entries.find(path);
        if (liveIt == live.entries.end()) {
            continue;
        }
        const Entry &liveEntry = liveIt->second;

        // Only a strict advance is a candidate; equal mtimes mean unchanged.
        if (liveEntry.mtime <= storedEntry.mtime) {
            continue;
        }

        if (liveEntry.hash != storedEntry.hash) {
            summary.modified.push_back(path);
            HLOG_INFO("Reconciler", "file_modified", {{"path", path.string()}});
            continue;
        }

        summary.rewound.push_back(RewoundFile{path, liveEntry.mtime, storedEntry.mtime});
        HLOG_INFO("Reconciler", "file_rewind",
                  {{"path", path.string()},
                   {"from", formatFileTime(liveEntry.mtime)},
                   {"to", formatFileTime(storedEntry.mtime)},
                   {"dryRun", dryRun}});
        if (dryRun) {
            HLOG_WARN("Reconciler", "dry_run_skip", {{"path", path.string()}});
            continue;
        }

        setMtime(path, storedEntry.mtime);
        corrected.emplace(path, storedEntry);
    }

    summary.removed = countMissing(*stored, live);
    summary.added = countMissing(live, *stored);

    HLOG_INFO("Reconciler", "rewind_done",
              {{"dryRun", dryRun},
               {"rewound", summary.rewoundCount()},
               {"modified", summary.modified.size()},
               {"added", summary.added},
               {"removed", summary.removed}});

    if (dryRun) {
        return summary;
    }

    // The new state is the live scan with rewound files carrying their stored
    // entry, so the recorded mtime matches the one now on disk.
    Snapshot next = live;
    for (auto &[path, entry] : corrected) {
        next.entries[path] = std::move(entry);
    }

    m_store.save(next);
    summary.stateSaved = true;
    return summary;
}

} // namespace hashprint
