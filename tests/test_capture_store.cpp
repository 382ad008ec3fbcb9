#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include <sqlite3.h>

#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "store/capture_store.hpp"

namespace {

mirulog::CaptureRecord makeCapture(const std::string &stamp, const std::string &image)
{
    mirulog::CaptureRecord record;
    record.capturedAt = mirulog::fromIso8601Utc(stamp);
    record.windowTitle = "main.cpp - editor";
    record.processName = "code";
    record.contentHash = "abc123";
    record.imagePath = image;
    record.hostName = "desk";
    return record;
}

mirulog::AnalysisResult makeResult(std::int64_t id)
{
    mirulog::AnalysisResult result;
    result.captureId = id;
    result.backend = "gemini";
    result.model = "gemini-1.5-flash";
    result.rawResponse = R"({"description":"Writing tests"})";
    result.fields.summary = "Writing tests";
    result.fields.primaryTask = "Testing";
    result.fields.confidence = 0.8;
    result.fields.tags = {"qt", "sqlite"};
    result.fields.observedFiles = {"test_capture_store.cpp"};
    result.lastAttemptAt = mirulog::fromIso8601Utc("2026-03-02T10:00:00Z");
    return result;
}

} // namespace

class CaptureStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();

    void testAddCaptureIsPending();
    void testPendingOldestFirstWithLimit();
    void testClaimIsExclusive();
    void testMarkAnalyzedPersistsFields();
    void testMarkFailedCountsFailures();
    void testFinishRequiresAnalyzing();
    void testExpiredLeaseIsClaimableAgain();
    void testStolenLeaseRejectsLateResult();
    void testRequeueFailed();
    void testImageDisposition();
    void testListEntriesWindow();
    void testReadOnlyOpen();
    void testMetaAndIntegrity();
    void testLockedShardReadsThrow();

private:
    QTemporaryDir m_tempDir;
    int m_dbCounter = 0;
    std::filesystem::path m_dbPath;
};

void CaptureStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("LOG_DIR", (m_tempDir.path() + "/logs").toUtf8());
}

void CaptureStoreTests::init()
{
    ++m_dbCounter;
    m_dbPath = std::filesystem::path(m_tempDir.path().toStdString())
        / ("shard-" + std::to_string(m_dbCounter)) / "mirulog.db";
}

void CaptureStoreTests::testAddCaptureIsPending()
{
    mirulog::CaptureStore store(m_dbPath);
    auto record = makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png");
    record.status = mirulog::CaptureStatus::Analyzed;
    const auto id = store.addCapture(record);

    const auto loaded = store.getCapture(id);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->status, mirulog::CaptureStatus::Pending);
    QCOMPARE(QString::fromStdString(loaded->windowTitle), QStringLiteral("main.cpp - editor"));
    QCOMPARE(QString::fromStdString(loaded->imagePath), QStringLiteral("/tmp/a.png"));
    QVERIFY(loaded->capturedAt == record.capturedAt);
    QCOMPARE(store.pendingCount(), 1);
    QVERIFY(!store.getAnalysis(id).has_value());
}

void CaptureStoreTests::testPendingOldestFirstWithLimit()
{
    mirulog::CaptureStore store(m_dbPath);
    store.addCapture(makeCapture("2026-03-02T09:02:00Z", "/tmp/c.png"));
    const auto first = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    const auto second = store.addCapture(makeCapture("2026-03-02T09:01:00Z", "/tmp/b.png"));

    const auto pending = store.pendingCaptures(2);
    QCOMPARE(pending.size(), static_cast<size_t>(2));
    QCOMPARE(pending[0].id, first);
    QCOMPARE(pending[1].id, second);

    QCOMPARE(store.pendingCaptures(0).size(), static_cast<size_t>(3));
}

void CaptureStoreTests::testClaimIsExclusive()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    const auto now = mirulog::fromIso8601Utc("2026-03-02T09:05:00Z");

    QVERIFY(store.claimForAnalysis(id, "host:1", now));
    QVERIFY(!store.claimForAnalysis(id, "host:2", now));
    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Analyzing);
    QCOMPARE(store.pendingCount(), 0);
    QCOMPARE(store.countByStatus(mirulog::CaptureStatus::Analyzing), 1);
}

void CaptureStoreTests::testMarkAnalyzedPersistsFields()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    QVERIFY(store.claimForAnalysis(id, "host:1", mirulog::fromIso8601Utc("2026-03-02T09:05:00Z")));

    auto result = makeResult(id);
    result.retryCount = 1;
    QVERIFY(store.markAnalyzed(result, "host:1"));

    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Analyzed);
    const auto analysis = store.getAnalysis(id);
    QVERIFY(analysis.has_value());
    QCOMPARE(QString::fromStdString(analysis->fields.primaryTask), QStringLiteral("Testing"));
    QCOMPARE(analysis->fields.tags.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(analysis->fields.observedFiles.at(0)),
             QStringLiteral("test_capture_store.cpp"));
    QCOMPARE(analysis->retryCount, 1);
    QCOMPARE(analysis->failureCount, 0);
    QVERIFY(analysis->errorDetail.empty());
}

void CaptureStoreTests::testMarkFailedCountsFailures()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    const auto now = mirulog::fromIso8601Utc("2026-03-02T09:05:00Z");

    QVERIFY(store.claimForAnalysis(id, "host:1", now));
    auto failure = makeResult(id);
    failure.errorDetail = "transient: 503";
    failure.retryCount = 5;
    QVERIFY(store.markFailed(failure, "host:1"));
    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Failed);
    QCOMPARE(store.getAnalysis(id)->failureCount, 1);

    QCOMPARE(store.requeueFailed(id), 1);
    QVERIFY(store.claimForAnalysis(id, "host:1", now));
    QVERIFY(store.markFailed(failure, "host:1"));

    const auto analysis = store.getAnalysis(id);
    QCOMPARE(analysis->failureCount, 2);
    QCOMPARE(analysis->retryCount, 5);
    QCOMPARE(QString::fromStdString(analysis->errorDetail), QStringLiteral("transient: 503"));
}

void CaptureStoreTests::testFinishRequiresAnalyzing()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));

    QVERIFY(!store.markAnalyzed(makeResult(id), "host:1"));
    QVERIFY(!store.markFailed(makeResult(id), "host:1"));
    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Pending);
    QVERIFY(!store.getAnalysis(id).has_value());
}

void CaptureStoreTests::testStolenLeaseRejectsLateResult()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    const auto claimedAt = mirulog::fromIso8601Utc("2026-03-02T09:05:00Z");
    QVERIFY(store.claimForAnalysis(id, "slow:1", claimedAt));

    // The first lease runs out and a second analyzer takes the row over.
    const auto later = claimedAt + std::chrono::minutes(31);
    QVERIFY(store.claimForAnalysis(id, "fast:2", later, later - std::chrono::minutes(30)));

    // The original owner finishing late must not overwrite the new claim.
    QVERIFY(!store.markAnalyzed(makeResult(id), "slow:1"));
    auto failure = makeResult(id);
    failure.errorDetail = "transient: late";
    QVERIFY(!store.markFailed(failure, "slow:1"));
    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Analyzing);
    QVERIFY(!store.getAnalysis(id).has_value());

    QVERIFY(store.markAnalyzed(makeResult(id), "fast:2"));
    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Analyzed);
    QCOMPARE(store.getAnalysis(id)->failureCount, 0);
}

void CaptureStoreTests::testExpiredLeaseIsClaimableAgain()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    const auto claimedAt = mirulog::fromIso8601Utc("2026-03-02T09:05:00Z");
    QVERIFY(store.claimForAnalysis(id, "crashed:1", claimedAt));

    // Lease still running.
    const auto earlyCutoff = claimedAt - std::chrono::minutes(30);
    QVERIFY(store.pendingCaptures(10, earlyCutoff).empty());
    QVERIFY(!store.claimForAnalysis(id, "host:2", claimedAt, earlyCutoff));

    // Lease expired.
    const auto lateCutoff = claimedAt + std::chrono::minutes(1);
    QCOMPARE(store.pendingCaptures(10, lateCutoff).size(), static_cast<size_t>(1));
    QCOMPARE(store.pendingCount(lateCutoff), 1);
    QVERIFY(store.claimForAnalysis(id, "host:2", claimedAt + std::chrono::minutes(31), lateCutoff));
    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Analyzing);
}

void CaptureStoreTests::testRequeueFailed()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto now = mirulog::fromIso8601Utc("2026-03-02T09:05:00Z");
    std::vector<std::int64_t> ids;
    for (int i = 0; i < 3; ++i) {
        const auto id = store.addCapture(makeCapture("2026-03-02T09:0" + std::to_string(i) + ":00Z",
                                                     "/tmp/" + std::to_string(i) + ".png"));
        QVERIFY(store.claimForAnalysis(id, "host:1", now));
        QVERIFY(store.markFailed(makeResult(id), "host:1"));
        ids.push_back(id);
    }

    QCOMPARE(store.requeueFailed(ids[0]), 1);
    QCOMPARE(store.countByStatus(mirulog::CaptureStatus::Failed), 2);
    QCOMPARE(store.requeueFailed(), 2);
    QCOMPARE(store.pendingCount(), 3);
    QCOMPARE(store.requeueFailed(), 0);
}

void CaptureStoreTests::testImageDisposition()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    QVERIFY(store.claimForAnalysis(id, "host:1", mirulog::fromIso8601Utc("2026-03-02T09:05:00Z")));
    QVERIFY(store.markAnalyzed(makeResult(id), "host:1"));

    store.recordImageDisposition(id, mirulog::ImageDisposition::Archived, "/archive/2026-03-02/a.png");
    const auto analysis = store.getAnalysis(id);
    QCOMPARE(analysis->imageDisposition, mirulog::ImageDisposition::Archived);
    QCOMPARE(QString::fromStdString(analysis->archivedPath), QStringLiteral("/archive/2026-03-02/a.png"));
}

void CaptureStoreTests::testListEntriesWindow()
{
    mirulog::CaptureStore store(m_dbPath);
    store.addCapture(makeCapture("2026-03-02T08:00:00Z", "/tmp/early.png"));
    const auto inside = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/in.png"));
    store.addCapture(makeCapture("2026-03-02T11:00:00Z", "/tmp/late.png"));
    QVERIFY(store.claimForAnalysis(inside, "host:1", mirulog::fromIso8601Utc("2026-03-02T09:05:00Z")));
    QVERIFY(store.markAnalyzed(makeResult(inside), "host:1"));

    const auto all = store.listEntries();
    QCOMPARE(all.size(), static_cast<size_t>(3));
    QVERIFY(all[0].capture.capturedAt <= all[1].capture.capturedAt);
    QVERIFY(all[1].capture.capturedAt <= all[2].capture.capturedAt);

    const auto windowed = store.listEntries(mirulog::fromIso8601Utc("2026-03-02T08:30:00Z"),
                                            mirulog::fromIso8601Utc("2026-03-02T10:00:00Z"));
    QCOMPARE(windowed.size(), static_cast<size_t>(1));
    QCOMPARE(windowed[0].capture.id, inside);
    QVERIFY(windowed[0].analysis.has_value());
    QCOMPARE(QString::fromStdString(windowed[0].analysis->fields.summary), QStringLiteral("Writing tests"));
}

void CaptureStoreTests::testReadOnlyOpen()
{
    bool threw = false;
    try {
        mirulog::CaptureStore missing(m_dbPath, mirulog::CaptureStore::OpenMode::ReadOnly);
    } catch (const mirulog::StoreError &) {
        threw = true;
    }
    QVERIFY(threw);
    QVERIFY(!std::filesystem::exists(m_dbPath));

    {
        mirulog::CaptureStore store(m_dbPath);
        store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    }

    mirulog::CaptureStore reader(m_dbPath, mirulog::CaptureStore::OpenMode::ReadOnly);
    QVERIFY(reader.isReadOnly());
    QCOMPARE(reader.listEntries().size(), static_cast<size_t>(1));

    threw = false;
    try {
        reader.addCapture(makeCapture("2026-03-02T09:01:00Z", "/tmp/b.png"));
    } catch (const mirulog::StoreError &) {
        threw = true;
    }
    QVERIFY(threw);
}

void CaptureStoreTests::testMetaAndIntegrity()
{
    {
        mirulog::CaptureStore store(m_dbPath);
        store.setMeta("test_key", "value");
        QCOMPARE(QString::fromStdString(store.getMeta("schema_version").value_or("")),
                 QStringLiteral("1"));
    }

    mirulog::CaptureStore store(m_dbPath);
    const auto value = store.getMeta("test_key");
    QVERIFY(value.has_value());
    QCOMPARE(QString::fromStdString(*value), QStringLiteral("value"));

    std::string message;
    QVERIFY(store.integrityCheck(&message));
}

void CaptureStoreTests::testLockedShardReadsThrow()
{
    mirulog::CaptureStore store(m_dbPath);
    const auto id = store.addCapture(makeCapture("2026-03-02T09:00:00Z", "/tmp/a.png"));
    QVERIFY(store.claimForAnalysis(id, "host:1", mirulog::fromIso8601Utc("2026-03-02T09:05:00Z")));
    QVERIFY(store.markAnalyzed(makeResult(id), "host:1"));

    // A second connection in exclusive locking mode keeps every reader out.
    sqlite3 *raw = nullptr;
    QCOMPARE(sqlite3_open_v2(m_dbPath.string().c_str(), &raw, SQLITE_OPEN_READWRITE, nullptr), SQLITE_OK);
    std::unique_ptr<sqlite3, int (*)(sqlite3 *)> holder(raw, &sqlite3_close);
    QCOMPARE(sqlite3_exec(raw, "PRAGMA locking_mode=EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);
    QCOMPARE(sqlite3_exec(raw, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);
    QCOMPARE(sqlite3_exec(raw, "INSERT OR REPLACE INTO meta (key, value) VALUES ('lock', '1');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);

    const auto throwsStoreError = [](const std::function<void()> &read) {
        try {
            read();
        } catch (const mirulog::StoreError &) {
            return true;
        }
        return false;
    };
    QVERIFY(throwsStoreError([&]() { store.getCapture(id); }));
    QVERIFY(throwsStoreError([&]() { store.getAnalysis(id); }));
    QVERIFY(throwsStoreError([&]() { store.getMeta("schema_version"); }));
    QVERIFY(throwsStoreError([&]() {
        std::string message;
        store.integrityCheck(&message);
    }));

    QCOMPARE(sqlite3_exec(raw, "ROLLBACK;", nullptr, nullptr, nullptr), SQLITE_OK);
    holder.reset();

    QCOMPARE(store.getCapture(id)->status, mirulog::CaptureStatus::Analyzed);
    QVERIFY(store.getAnalysis(id).has_value());
}

QTEST_MAIN(CaptureStoreTests)
#include "test_capture_store.moc"
