#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hashprint {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Nanoseconds since the filesystem clock's epoch; the persisted form of an mtime.
inline int64_t fileTimeToNanos(std::filesystem::file_time_type time)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               time.time_since_epoch())
        .count();
}

inline std::filesystem::file_time_type fileTimeFromNanos(int64_t nanos)
{
    return std::filesystem::file_time_type{
        std::chrono::duration_cast<std::filesystem::file_time_type::duration>(
            std::chrono::nanoseconds{nanos})};
}

inline std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time)
{
    using std::chrono::system_clock;
    const auto offset = time - std::filesystem::file_time_type::clock::now();
    return system_clock::now()
        + std::chrono::duration_cast<system_clock::duration>(offset);
}

// Human readable, for reports and logs only: the file clock to system clock
// conversion is approximate.
inline std::string formatFileTime(std::filesystem::file_time_type time)
{
    const auto sys = toSystemTime(time);
    const auto sinceEpoch = sys.time_since_epoch();
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                           sinceEpoch - std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch))
                           .count();

    std::string iso = toIso8601Utc(sys);
    std::ostringstream fraction;
    fraction << '.' << std::setw(9) << std::setfill('0') << (nanos < 0 ? 0 : nanos);
    iso.insert(iso.size() - 1, fraction.str());
    return iso;
}

inline std::string toHex(const std::string &bytes)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const char c : bytes) {
        const auto value = static_cast<unsigned char>(c);
        out.push_back(kDigits[value >> 4]);
        out.push_back(kDigits[value & 0x0F]);
    }
    return out;
}

inline void to_json(nlohmann::json &j, const Entry &entry)
{
    j = nlohmann::json{
        {"hash", toHex(entry.hash)},
        {"mtime", formatFileTime(entry.mtime)},
        {"mtimeNs", fileTimeToNanos(entry.mtime)}
    };
}

inline void to_json(nlohmann::json &j, const RewoundFile &file)
{
    j = nlohmann::json{
        {"path", file.path.string()},
        {"from", formatFileTime(file.from)},
        {"to", formatFileTime(file.to)}
    };
}

inline void to_json(nlohmann::json &j, const ReconcileSummary &summary)
{
    nlohmann::json modified = nlohmann::json::array();
    for (const auto &path : summary.modified) {
        modified.push_back(path.string());
    }

    j = nlohmann::json{
        {"root", summary.root.string()},
        {"dryRun", summary.dryRun},
        {"firstRun", summary.firstRun},
        {"filesHashed", summary.filesHashed},
        {"added", summary.added},
        {"removed", summary.removed},
        {"stateSaved", summary.stateSaved},
        {"rewoundCount", summary.rewoundCount()},
        {"rewound", summary.rewound},
        {"modified", modified}
    };
}

} // namespace hashprint
