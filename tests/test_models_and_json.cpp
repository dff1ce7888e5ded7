#include <QtTest/QtTest>

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace fs = std::filesystem;

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testHexEncoding();
    void testFileTimeNanos();
    void testFormatFileTime();
    void testEntryEquality();
    void testSummaryJson();
    void testErrorKinds();
};

void ModelsJsonTests::testHexEncoding()
{
    QCOMPARE(QString::fromStdString(hashprint::toHex(std::string("\x00\x0f\xa0\xff", 4))),
             QStringLiteral("000fa0ff"));
    QVERIFY(hashprint::toHex(std::string()).empty());
}

void ModelsJsonTests::testFileTimeNanos()
{
    const int64_t nanos = 1700000000123456789LL;
    const fs::file_time_type time = hashprint::fileTimeFromNanos(nanos);
    QCOMPARE(hashprint::fileTimeToNanos(time), nanos);

    const int64_t beforeEpoch = -42;
    QCOMPARE(hashprint::fileTimeToNanos(hashprint::fileTimeFromNanos(beforeEpoch)), beforeEpoch);
}

void ModelsJsonTests::testFormatFileTime()
{
    const fs::file_time_type now = fs::file_time_type::clock::now();
    const std::string formatted = hashprint::formatFileTime(now);

    // yyyy-mm-ddThh:mm:ss.nnnnnnnnnZ
    QCOMPARE(formatted.size(), static_cast<size_t>(30));
    QCOMPARE(formatted[10], 'T');
    QCOMPARE(formatted[19], '.');
    QCOMPARE(formatted.back(), 'Z');
}

void ModelsJsonTests::testEntryEquality()
{
    const fs::file_time_type when = hashprint::fileTimeFromNanos(1000);
    const hashprint::Entry a{std::string(32, 'a'), when};
    hashprint::Entry b = a;
    QVERIFY(a == b);

    b.mtime = hashprint::fileTimeFromNanos(1001);
    QVERIFY(a != b);

    b = a;
    b.hash[0] = 'b';
    QVERIFY(a != b);
}

void ModelsJsonTests::testSummaryJson()
{
    hashprint::ReconcileSummary summary;
    summary.root = "/work/project";
    summary.dryRun = true;
    summary.filesHashed = 3;
    summary.removed = 1;
    summary.rewound.push_back(hashprint::RewoundFile{"/work/project/a",
                                                     hashprint::fileTimeFromNanos(2000),
                                                     hashprint::fileTimeFromNanos(1000)});
    summary.modified.push_back("/work/project/b");

    const nlohmann::json j = summary;

    QCOMPARE(QString::fromStdString(j.value("root", "")), QStringLiteral("/work/project"));
    QVERIFY(j.value("dryRun", false));
    QVERIFY(!j.value("firstRun", true));
    QCOMPARE(j.value("filesHashed", 0), 3);
    QCOMPARE(j.value("removed", 0), 1);
    QCOMPARE(j.value("rewoundCount", 0), 1);
    QCOMPARE(QString::fromStdString(j.at("rewound").at(0).value("path", "")),
             QStringLiteral("/work/project/a"));
    QVERIFY(j.at("rewound").at(0).contains("from"));
    QCOMPARE(QString::fromStdString(j.at("modified").at(0).get<std::string>()),
             QStringLiteral("/work/project/b"));
}

void ModelsJsonTests::testErrorKinds()
{
    const hashprint::HashprintError error(hashprint::ErrorKind::RootMismatch, "elsewhere");
    QVERIFY(error.kind() == hashprint::ErrorKind::RootMismatch);
    QCOMPARE(QString::fromLatin1(error.what()), QStringLiteral("elsewhere"));
    QCOMPARE(QString::fromLatin1(hashprint::toKindString(hashprint::ErrorKind::Io)),
             QStringLiteral("io"));
    QCOMPARE(QString::fromLatin1(hashprint::toKindString(hashprint::ErrorKind::Deserialize)),
             QStringLiteral("deserialize"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
