#include "core/snapshot_builder.hpp"

#include <string>
#include <system_error>
#include <utility>

#include <QCryptographicHash>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace hashprint {

namespace {

namespace fs = std::filesystem;

HashprintError ioError(const std::string &what, const fs::path &path,
                       const std::string &reason)
{
    return HashprintError(ErrorKind::Io, what + " " + path.string() + ": " + reason);
}

bool isHidden(const fs::path &path)
{
    const std::string name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

bool hasCacheMarker(const fs::directory_entry &entry)
{
    std::error_code error;
    if (!entry.is_directory(error) || entry.is_symlink(error)) {
        return false;
    }
    // An unreadable marker counts as absent.
    return fs::exists(entry.path() / kCacheMarkerName, error);
}

} // namespace

Entry hashFile(const fs::path &path)
{
    QFile file(QFile::decodeName(path.c_str()));
    if (!file.open(QIODevice::ReadOnly)) {
        throw ioError("cannot open", path, file.errorString().toStdString());
    }

    QCryptographicHash hasher(QCryptographicHash::Sha256);
    if (!hasher.addData(&file) || file.error() != QFileDevice::NoError) {
        throw ioError("cannot read", path, file.errorString().toStdString());
    }

    Entry entry;
    entry.hash = hasher.result().toStdString();

    std::error_code error;
    entry.mtime = fs::last_write_time(path, error);
    if (error) {
        throw ioError("cannot stat", path, error.message());
    }
    return entry;
}

Snapshot computeSnapshot(const fs::path &root)
{
    HLOG_INFO("SnapshotBuilder", "hash_scan_start", {{"root", root.string()}});

    Snapshot snapshot;
    snapshot.root = root;

    std::error_code error;
    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, error);
    if (error) {
        throw ioError("cannot list", root, error.message());
    }

    const fs::recursive_directory_iterator end;
    std::size_t pruned = 0;
    while (it != end) {
        const fs::directory_entry &entry = *it;

        if (isHidden(entry.path()) || hasCacheMarker(entry)) {
            // No-op for files; for directories nothing below is visited.
            it.disable_recursion_pending();
            ++pruned;
            HLOG_DEBUG("SnapshotBuilder", "entry_pruned",
                       {{"path", entry.path().string()}});
        } else {
            const fs::file_status status = entry.symlink_status(error);
            if (error) {
                throw ioError("cannot stat", entry.path(), error.message());
            }
            if (fs::is_regular_file(status)) {
                Entry hashed = hashFile(entry.path());
                HLOG_DEBUG("SnapshotBuilder", "file_hashed",
                           {{"path", entry.path().string()},
                            {"entry", hashed}});
                snapshot.entries.emplace(entry.path(), std::move(hashed));
            }
        }

        it.increment(error);
        if (error) {
            throw ioError("cannot traverse", root, error.message());
        }
    }

    HLOG_INFO("SnapshotBuilder", "hash_scan_done",
              {{"root", root.string()},
               {"files", snapshot.entries.size()},
               {"pruned", pruned}});
    return snapshot;
}

} // namespace hashprint
