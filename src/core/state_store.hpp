#pragma once

#include <filesystem>
#include <optional>

#include "common/models.hpp"

namespace hashprint {

inline constexpr const char *kStateFileName = ".hashprint";
inline constexpr int kStateSchemaVersion = 1;

// StateStore persists one Snapshot per root in a hidden SQLite file directly
// inside that root. Every call opens and closes the file; nothing is cached
// between calls.
class StateStore {
public:
    std::filesystem::path statePath(const std::filesystem::path &root) const;
    bool exists(const std::filesystem::path &root) const;

    // Returns std::nullopt when no state file exists yet (first run).
    // Throws HashprintError: Io when the file cannot be read, Deserialize when
    // it is not a state file of the current schema, RootMismatch when it was
    // written for a different root.
    std::optional<Snapshot> load(const std::filesystem::path &root) const;

    // Replaces the state file of snapshot.root. The replacement is not atomic.
    // Throws HashprintError(Io) on any write failure.
    void save(const Snapshot &snapshot) const;
};

} // namespace hashprint
