#include <QtTest/QtTest>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QLockFile>
#include <QTemporaryDir>

#include <filesystem>
#include <fstream>
#include <set>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "detector/change_detector.hpp"
#include "report/change_records.hpp"

class ChangeDetectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void testFirstRunOnEmptyDirectory();
    void testFileLifecycle();
    void testFileLifecycle_data();
    void testSecondScanIsEmpty();
    void testMultipleFilesAppearOnce();
    void testRewriteWithSameMtimeIsUnchanged();
    void testMissingDirectoryKeepsState();
    void testMissingDirectoryCreatesNoStateDirectory();
    void testNonUtf8NameIsPersisted();
    void testNonUtf8NameIsPersisted_data();
    void testCorruptStateStartsFresh();
    void testSaveFailureStillReportsChanges();
    void testLockHeldElsewhere();

private:
    std::unique_ptr<QTemporaryDir> m_root;
    QString m_watchDir;
    QString m_statePath;

    driftwatch::DetectorConfig makeConfig(driftwatch::StateBackend backend) const;
    QString watched(const QString &name) const;

    static void writeFile(const QString &path, const QByteArray &content);
    static void setModified(const QString &path, qint64 msecsSinceEpoch);
    static QByteArray readAll(const QString &path);
};

void ChangeDetectorTests::initTestCase()
{
    driftwatch::logging::initLogging(QStringLiteral("driftwatch-test"),
                                     driftwatch::logging::LogLevel::Error);
}

void ChangeDetectorTests::init()
{
    m_root = std::make_unique<QTemporaryDir>();
    QVERIFY(m_root->isValid());
    QVERIFY(QDir(m_root->path()).mkdir(QStringLiteral("watched")));
    m_watchDir = m_root->filePath(QStringLiteral("watched"));
    m_statePath = m_root->filePath(QStringLiteral("state/file-state.json"));
}

driftwatch::DetectorConfig ChangeDetectorTests::makeConfig(driftwatch::StateBackend backend) const
{
    driftwatch::DetectorConfig config;
    config.monitoredDir = m_watchDir.toStdString();
    config.statePath = m_statePath.toStdString();
    config.backend = backend;
    config.lockTimeoutMs = 200;
    return config;
}

QString ChangeDetectorTests::watched(const QString &name) const
{
    return QDir(m_watchDir).filePath(name);
}

void ChangeDetectorTests::writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QCOMPARE(file.write(content), static_cast<qint64>(content.size()));
}

void ChangeDetectorTests::setModified(const QString &path, qint64 msecsSinceEpoch)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadWrite));
    QVERIFY(file.setFileTime(QDateTime::fromMSecsSinceEpoch(msecsSinceEpoch),
                             QFileDevice::FileModificationTime));
}

QByteArray ChangeDetectorTests::readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

void ChangeDetectorTests::testFirstRunOnEmptyDirectory()
{
    driftwatch::ChangeDetector detector(makeConfig(driftwatch::StateBackend::Json));
    const auto changes = detector.detectChanges();

    QVERIFY(changes.created.empty());
    QVERIFY(changes.modified.empty());
    QVERIFY(changes.deleted.empty());

    QVERIFY(QFile::exists(m_statePath));
    const auto state = nlohmann::json::parse(readAll(m_statePath).toStdString());
    QVERIFY(state.is_object());
    QVERIFY(state.empty());
    QVERIFY(!QFile::exists(m_statePath + QStringLiteral(".lock")));
}

void ChangeDetectorTests::testFileLifecycle_data()
{
    QTest::addColumn<int>("backend");
    QTest::newRow("json") << static_cast<int>(driftwatch::StateBackend::Json);
    QTest::newRow("sqlite") << static_cast<int>(driftwatch::StateBackend::Sqlite);
}

void ChangeDetectorTests::testFileLifecycle()
{
    QFETCH(int, backend);
    const auto config = makeConfig(static_cast<driftwatch::StateBackend>(backend));
    const QString file = watched(QStringLiteral("a.txt"));
    const qint64 t1 = 1700000000000LL;
    const qint64 t2 = t1 + 60000;

    // Scan 1: new file.
    writeFile(file, QByteArray(10, 'a'));
    setModified(file, t1);
    {
        driftwatch::ChangeDetector detector(config);
        const auto changes = detector.detectChanges();
        QCOMPARE(static_cast<int>(changes.created.size()), 1);
        QVERIFY(changes.modified.empty());
        QVERIFY(changes.deleted.empty());
        QCOMPARE(QString::fromStdString(changes.created.front().path), file);
        QCOMPARE(changes.created.front().current->size, static_cast<std::uint64_t>(10));
    }

    // Scan 2: nothing happened.
    {
        driftwatch::ChangeDetector detector(config);
        QVERIFY(detector.detectChanges().empty());
    }

    // Scan 3: rewritten with a later mtime.
    writeFile(file, QByteArray(20, 'b'));
    setModified(file, t2);
    {
        driftwatch::ChangeDetector detector(config);
        const auto changes = detector.detectChanges();
        QVERIFY(changes.created.empty());
        QVERIFY(changes.deleted.empty());
        QCOMPARE(static_cast<int>(changes.modified.size()), 1);

        const auto &change = changes.modified.front();
        QCOMPARE(change.previous->size, static_cast<std::uint64_t>(10));
        QCOMPARE(change.current->size, static_cast<std::uint64_t>(20));
        QCOMPARE(static_cast<qint64>(change.previous->modifiedAt.time_since_epoch().count()), t1);
        QCOMPARE(static_cast<qint64>(change.current->modifiedAt.time_since_epoch().count()), t2);

        const auto record = driftwatch::toChangeRecord(change);
        QCOMPARE(record.value("sizeDelta", 0), 10);
        QCOMPARE(QString::fromStdString(record.value("sizeChange", "")),
                 QStringLiteral("+10 Bytes"));
    }

    // Scan 4: deleted, reported with the last known record.
    QVERIFY(QFile::remove(file));
    {
        driftwatch::ChangeDetector detector(config);
        const auto changes = detector.detectChanges();
        QVERIFY(changes.created.empty());
        QVERIFY(changes.modified.empty());
        QCOMPARE(static_cast<int>(changes.deleted.size()), 1);

        const auto &change = changes.deleted.front();
        QVERIFY(!change.current.has_value());
        QCOMPARE(change.previous->size, static_cast<std::uint64_t>(20));
        QCOMPARE(static_cast<qint64>(change.previous->modifiedAt.time_since_epoch().count()), t2);
    }

    // Scan 5 and beyond: absent from both states.
    for (int i = 0; i < 2; ++i) {
        driftwatch::ChangeDetector detector(config);
        QVERIFY(detector.detectChanges().empty());
    }
}

void ChangeDetectorTests::testSecondScanIsEmpty()
{
    writeFile(watched(QStringLiteral("one.log")), QByteArray("1"));
    writeFile(watched(QStringLiteral("two.log")), QByteArray("22"));
    QVERIFY(QDir(m_watchDir).mkdir(QStringLiteral("archive")));

    driftwatch::ChangeDetector detector(makeConfig(driftwatch::StateBackend::Json));
    QCOMPARE(static_cast<int>(detector.detectChanges().created.size()), 2);
    QVERIFY(detector.detectChanges().empty());
}

void ChangeDetectorTests::testMultipleFilesAppearOnce()
{
    const auto config = makeConfig(driftwatch::StateBackend::Json);
    writeFile(watched(QStringLiteral("keep.txt")), QByteArray("k"));
    writeFile(watched(QStringLiteral("drop.txt")), QByteArray("d"));
    {
        driftwatch::ChangeDetector detector(config);
        QCOMPARE(static_cast<int>(detector.detectChanges().created.size()), 2);
    }

    QVERIFY(QFile::remove(watched(QStringLiteral("drop.txt"))));
    writeFile(watched(QStringLiteral("new1.txt")), QByteArray("n"));
    writeFile(watched(QStringLiteral("new2.txt")), QByteArray("nn"));

    driftwatch::ChangeDetector detector(config);
    const auto changes = detector.detectChanges();

    std::set<QString> created;
    for (const auto &change : changes.created) {
        created.insert(QString::fromStdString(change.path));
    }
    QCOMPARE(static_cast<int>(changes.created.size()), 2);
    QVERIFY(created.contains(watched(QStringLiteral("new1.txt"))));
    QVERIFY(created.contains(watched(QStringLiteral("new2.txt"))));
    QVERIFY(changes.modified.empty());
    QCOMPARE(static_cast<int>(changes.deleted.size()), 1);
    QCOMPARE(QString::fromStdString(changes.deleted.front().path),
             watched(QStringLiteral("drop.txt")));
}

void ChangeDetectorTests::testRewriteWithSameMtimeIsUnchanged()
{
    // modifiedAt is the only change signal. A rewrite that keeps both the
    // mtime and the size is not detected, and neither is a size change
    // with the mtime held back.
    const auto config = makeConfig(driftwatch::StateBackend::Json);
    const QString file = watched(QStringLiteral("data.bin"));
    const qint64 mtime = 1700000000000LL;

    writeFile(file, QByteArray("aaaa"));
    setModified(file, mtime);
    {
        driftwatch::ChangeDetector detector(config);
        QCOMPARE(static_cast<int>(detector.detectChanges().created.size()), 1);
    }

    writeFile(file, QByteArray("bbbb"));
    setModified(file, mtime);
    {
        driftwatch::ChangeDetector detector(config);
        QVERIFY(detector.detectChanges().empty());
    }

    writeFile(file, QByteArray("bbbbbbbb"));
    setModified(file, mtime);
    {
        driftwatch::ChangeDetector detector(config);
        QVERIFY(detector.detectChanges().empty());
    }
}

void ChangeDetectorTests::testMissingDirectoryKeepsState()
{
    const auto config = makeConfig(driftwatch::StateBackend::Json);
    writeFile(watched(QStringLiteral("a.txt")), QByteArray("a"));
    {
        driftwatch::ChangeDetector detector(config);
        detector.detectChanges();
    }
    const QByteArray before = readAll(m_statePath);
    QVERIFY(!before.isEmpty());

    QVERIFY(QDir(m_watchDir).removeRecursively());

    driftwatch::ChangeDetector detector(config);
    QVERIFY_THROWS_EXCEPTION(driftwatch::DirectoryUnavailable, detector.detectChanges());
    QCOMPARE(readAll(m_statePath), before);
    QVERIFY(!QFile::exists(m_statePath + QStringLiteral(".lock")));
}

void ChangeDetectorTests::testMissingDirectoryCreatesNoStateDirectory()
{
    QVERIFY(QDir(m_watchDir).removeRecursively());
    m_statePath = m_root->filePath(QStringLiteral("fresh/deploy/file-state.json"));

    driftwatch::ChangeDetector detector(makeConfig(driftwatch::StateBackend::Json));
    QVERIFY_THROWS_EXCEPTION(driftwatch::DirectoryUnavailable, detector.detectChanges());
    QVERIFY(!QFileInfo::exists(m_root->filePath(QStringLiteral("fresh"))));
}

void ChangeDetectorTests::testNonUtf8NameIsPersisted_data()
{
    testFileLifecycle_data();
}

void ChangeDetectorTests::testNonUtf8NameIsPersisted()
{
    QFETCH(int, backend);
    const auto config = makeConfig(static_cast<driftwatch::StateBackend>(backend));

    const std::filesystem::path badName =
        std::filesystem::path(m_watchDir.toStdString()) / std::string("bad\xff.txt");
    {
        std::ofstream out(badName, std::ios::binary);
        out << "raw";
        QVERIFY(out.good());
    }
    writeFile(watched(QStringLiteral("good.txt")), QByteArray("g"));

    {
        driftwatch::ChangeDetector detector(config);
        const auto changes = detector.detectChanges();
        QCOMPARE(static_cast<int>(changes.created.size()), 2);

        std::set<std::string> created;
        for (const auto &change : changes.created) {
            created.insert(change.path);
        }
        QVERIFY(created.contains(badName.string()));
    }

    driftwatch::ChangeDetector detector(config);
    QVERIFY(detector.detectChanges().empty());

    QVERIFY(std::filesystem::remove(badName));
    const auto changes = detector.detectChanges();
    QCOMPARE(static_cast<int>(changes.deleted.size()), 1);
    QVERIFY(changes.deleted.front().path == badName.string());
    QVERIFY(changes.deleted.front().previous.has_value());
    QVERIFY(changes.deleted.front().previous->name == std::string("bad\xff.txt"));
}

void ChangeDetectorTests::testCorruptStateStartsFresh()
{
    writeFile(watched(QStringLiteral("a.txt")), QByteArray("a"));
    QVERIFY(QDir().mkpath(QFileInfo(m_statePath).absolutePath()));
    writeFile(m_statePath, QByteArray("not json at all"));

    driftwatch::ChangeDetector detector(makeConfig(driftwatch::StateBackend::Json));
    const auto changes = detector.detectChanges();
    QCOMPARE(static_cast<int>(changes.created.size()), 1);

    const auto state = nlohmann::json::parse(readAll(m_statePath).toStdString());
    QVERIFY(state.contains(watched(QStringLiteral("a.txt")).toStdString()));
}

void ChangeDetectorTests::testSaveFailureStillReportsChanges()
{
    // A directory sitting on the state path makes every save fail.
    QVERIFY(QDir().mkpath(m_statePath));
    writeFile(watched(QStringLiteral("a.txt")), QByteArray("a"));

    driftwatch::ChangeDetector detector(makeConfig(driftwatch::StateBackend::Json));
    const auto first = detector.detectChanges();
    QCOMPARE(static_cast<int>(first.created.size()), 1);

    // Nothing was persisted, so the same file is reported again.
    const auto second = detector.detectChanges();
    QCOMPARE(static_cast<int>(second.created.size()), 1);
}

void ChangeDetectorTests::testLockHeldElsewhere()
{
    QVERIFY(QDir().mkpath(QFileInfo(m_statePath).absolutePath()));
    QLockFile held(m_statePath + QStringLiteral(".lock"));
    QVERIFY(held.tryLock(0));

    writeFile(watched(QStringLiteral("a.txt")), QByteArray("a"));
    driftwatch::ChangeDetector detector(makeConfig(driftwatch::StateBackend::Json));
    QVERIFY_THROWS_EXCEPTION(driftwatch::StateLockUnavailable, detector.detectChanges());
    QVERIFY(!QFile::exists(m_statePath));

    held.unlock();
    QCOMPARE(static_cast<int>(detector.detectChanges().created.size()), 1);
}

QTEST_MAIN(ChangeDetectorTests)
#include "test_change_detector.moc"
