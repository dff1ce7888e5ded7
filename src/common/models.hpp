#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace hashprint {

struct Entry {
    // Raw SHA-256 digest bytes of the full file content.
    std::string hash;
    std::filesystem::file_time_type mtime;

    bool operator==(const Entry &other) const
    {
        return hash == other.hash && mtime == other.mtime;
    }
    bool operator!=(const Entry &other) const
    {
        return !(*this == other);
    }
};

struct Snapshot {
    std::filesystem::path root;
    // Keyed by absolute path; every key lies strictly inside root.
    std::map<std::filesystem::path, Entry> entries;
};

struct RewoundFile {
    std::filesystem::path path;
    std::filesystem::file_time_type from;
    std::filesystem::file_time_type to;
};

struct ReconcileSummary {
    std::filesystem::path root;
    bool dryRun = false;
    bool firstRun = false;
    bool stateSaved = false;

    std::size_t filesHashed = 0;
    std::size_t added = 0;
    std::size_t removed = 0;

    std::vector<RewoundFile> rewound;
    std::vector<std::filesystem::path> modified;

    std::size_t rewoundCount() const
    {
        return rewound.size();
    }
};

} // namespace hashprint
