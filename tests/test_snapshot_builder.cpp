#include <QtTest/QtTest>

#include <QCryptographicHash>
#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "common/errors.hpp"
#include "core/snapshot_builder.hpp"

namespace fs = std::filesystem;

class SnapshotBuilderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testHashesRegularFiles();
    void testStreamsLargeFiles();
    void testHiddenAndCacheMarkedDirsArePruned();
    void testHiddenRootIsStillScanned();
    void testSymlinksAreSkipped();
    void testUnreadableFileAborts();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
    fs::path m_root;

    fs::path writeFile(const fs::path &relative, const std::string &content) const;
};

void SnapshotBuilderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("HASHPRINT_LOG_DIR");
    qputenv("HASHPRINT_LOG_DIR", (m_tempDir.path() + "/logs").toUtf8());
}

void SnapshotBuilderTests::cleanupTestCase()
{
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("HASHPRINT_LOG_DIR");
    } else {
        qputenv("HASHPRINT_LOG_DIR", m_prevLogDir);
    }
}

void SnapshotBuilderTests::init()
{
    m_root = fs::path(m_tempDir.path().toStdString()) / QTest::currentTestFunction();
    std::error_code error;
    fs::remove_all(m_root, error);
    fs::create_directories(m_root);
}

fs::path SnapshotBuilderTests::writeFile(const fs::path &relative,
                                         const std::string &content) const
{
    const fs::path path = m_root / relative;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

void SnapshotBuilderTests::testHashesRegularFiles()
{
    const fs::path a = writeFile("a", "a");
    const fs::path b = writeFile("sub/dir/b", "b");

    const hashprint::Snapshot snapshot = hashprint::computeSnapshot(m_root);

    QVERIFY(snapshot.root == m_root);
    QCOMPARE(snapshot.entries.size(), static_cast<std::size_t>(2));
    QVERIFY(snapshot.entries.count(a) == 1);
    QVERIFY(snapshot.entries.count(b) == 1);

    const std::string expected =
        QCryptographicHash::hash(QByteArray("a"), QCryptographicHash::Sha256).toStdString();
    QCOMPARE(snapshot.entries.at(a).hash.size(), static_cast<std::size_t>(32));
    QVERIFY(snapshot.entries.at(a).hash == expected);
    QVERIFY(snapshot.entries.at(a).hash != snapshot.entries.at(b).hash);
    QVERIFY(snapshot.entries.at(a).mtime == fs::last_write_time(a));
}

void SnapshotBuilderTests::testStreamsLargeFiles()
{
    std::string content;
    for (int i = 0; i < 300000; ++i) {
        content += std::to_string(i);
    }
    const fs::path big = writeFile("big.bin", content);

    const hashprint::Entry entry = hashprint::hashFile(big);
    const std::string expected = QCryptographicHash::hash(
        QByteArray::fromStdString(content), QCryptographicHash::Sha256).toStdString();
    QVERIFY(entry.hash == expected);
}

void SnapshotBuilderTests::testHiddenAndCacheMarkedDirsArePruned()
{
    const fs::path kept = writeFile("src/main.c", "int main() {}");
    writeFile(".git/config", "[core]");
    writeFile(".git/objects/ab/cdef", "blob");
    writeFile(".env", "SECRET=1");
    writeFile("src/.cache/index", "cached");
    writeFile("target/CACHEDIR.TAG", "Signature: 8a477f597d28d172789f06886806bc55");
    writeFile("target/debug/app", "binary");
    writeFile("src/build/CACHEDIR.TAG", "");
    writeFile("src/build/nested/out.o", "object");

    const hashprint::Snapshot snapshot = hashprint::computeSnapshot(m_root);

    QCOMPARE(snapshot.entries.size(), static_cast<std::size_t>(1));
    QVERIFY(snapshot.entries.count(kept) == 1);
}

void SnapshotBuilderTests::testHiddenRootIsStillScanned()
{
    const fs::path hiddenRoot = m_root / ".workspace";
    fs::create_directories(hiddenRoot);
    std::ofstream(hiddenRoot / "file.txt") << "content";
    std::ofstream(hiddenRoot / "CACHEDIR.TAG") << "";

    const hashprint::Snapshot snapshot = hashprint::computeSnapshot(hiddenRoot);

    // CACHEDIR.TAG itself is an ordinary file of the root.
    QCOMPARE(snapshot.entries.size(), static_cast<std::size_t>(2));
    QVERIFY(snapshot.entries.count(hiddenRoot / "file.txt") == 1);
}

void SnapshotBuilderTests::testSymlinksAreSkipped()
{
    const fs::path target = writeFile("target.txt", "target");
    fs::create_directories(m_root / "realdir");
    writeFile("realdir/inner.txt", "inner");
    fs::create_symlink(target, m_root / "link.txt");
    fs::create_directory_symlink(m_root / "realdir", m_root / "linkdir");

    const hashprint::Snapshot snapshot = hashprint::computeSnapshot(m_root);

    QCOMPARE(snapshot.entries.size(), static_cast<std::size_t>(2));
    QVERIFY(snapshot.entries.count(m_root / "link.txt") == 0);
    QVERIFY(snapshot.entries.count(m_root / "linkdir/inner.txt") == 0);
}

void SnapshotBuilderTests::testUnreadableFileAborts()
{
    if (geteuid() == 0) {
        QSKIP("root can read files without permission bits");
    }

    writeFile("readable", "ok");
    const fs::path locked = writeFile("locked", "secret");
    fs::permissions(locked, fs::perms::none);

    bool thrown = false;
    try {
        hashprint::computeSnapshot(m_root);
    } catch (const hashprint::HashprintError &error) {
        thrown = true;
        QVERIFY(error.kind() == hashprint::ErrorKind::Io);
        QVERIFY(std::string(error.what()).find("locked") != std::string::npos);
    }
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_write);
    QVERIFY(thrown);
}

QTEST_MAIN(SnapshotBuilderTests)
#include "test_snapshot_builder.moc"
