#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <limits>

#include "analyzer/retry_controller.hpp"
#include "test_fakes.hpp"

using namespace std::chrono_literals;

class RetryControllerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testSuccessNeedsNoRetry();
    void testRetryAfterHintIsHonoured();
    void testHugeHintIsClampedToMaxWait();
    void testFatalErrorShortCircuits();
    void testRetriesAreBounded();
    void testConnectionRefusedBound();
    void testBackoffSequence();
    void testRequestSpacing();

private:
    QTemporaryDir m_tempDir;
};

void RetryControllerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("LOG_DIR", (m_tempDir.path() + "/logs").toUtf8());
}

void RetryControllerTests::testSuccessNeedsNoRetry()
{
    mirulog::testing::ManualClock clock;
    mirulog::testing::ScriptedBackend backend(clock);
    mirulog::RetryController retry(mirulog::RetryConfig{}, clock, backend.backendId());

    const auto outcome = retry.run([&]() { return backend.analyze({}); });
    QVERIFY(outcome.succeeded());
    QCOMPARE(outcome.attempts, 1);
    QCOMPARE(outcome.retries, 0);
    QVERIFY(!outcome.lastError.has_value());
    QVERIFY(clock.sleeps.empty());
}

void RetryControllerTests::testRetryAfterHintIsHonoured()
{
    mirulog::testing::ManualClock clock;
    mirulog::testing::ScriptedBackend backend(clock);
    backend.pushError(mirulog::ErrorKind::RateLimited, std::chrono::milliseconds(10s));

    mirulog::RetryConfig config;
    config.retryBufferSeconds = 0.5;
    mirulog::RetryController retry(config, clock, backend.backendId());

    const auto outcome = retry.run([&]() { return backend.analyze({}); });
    QVERIFY(outcome.succeeded());
    QCOMPARE(outcome.retries, 1);
    QCOMPARE(outcome.attempts, 2);
    QCOMPARE(backend.callTimes.size(), static_cast<size_t>(2));
    QVERIFY(backend.callTimes[1] - backend.callTimes[0] >= 10s);
    QCOMPARE(clock.sleeps.size(), static_cast<size_t>(1));
    QVERIFY(clock.sleeps.front() == 10500ms);
}

void RetryControllerTests::testHugeHintIsClampedToMaxWait()
{
    mirulog::testing::ManualClock clock;
    mirulog::testing::ScriptedBackend backend(clock);
    backend.pushError(mirulog::ErrorKind::RateLimited, mirulog::retryHintFromSeconds(1e300));
    backend.pushError(mirulog::ErrorKind::RateLimited, mirulog::retryHintFromSeconds(
        std::numeric_limits<double>::infinity()));

    mirulog::RetryConfig config;
    config.retryBufferSeconds = 0.5;
    config.maxRetryWaitSeconds = 120.0;
    mirulog::RetryController retry(config, clock, backend.backendId());

    const auto outcome = retry.run([&]() { return backend.analyze({}); });
    QVERIFY(outcome.succeeded());
    QCOMPARE(outcome.retries, 2);
    QCOMPARE(clock.sleeps.size(), static_cast<size_t>(2));
    // Clamped, buffer included.
    QVERIFY(clock.sleeps[0] == 120s);
    // An infinite hint is no hint: plain backoff for the second retry.
    QVERIFY(clock.sleeps[1] == 4s);
    for (const auto &sleep : clock.sleeps) {
        QVERIFY(sleep > 0ms);
    }

    QVERIFY(retry.hintedDelay(std::chrono::milliseconds(10s)) == 10500ms);
    QVERIFY(retry.hintedDelay(std::chrono::milliseconds(119800)) == 120s);
}

void RetryControllerTests::testFatalErrorShortCircuits()
{
    const mirulog::ErrorKind fatalKinds[] = {
        mirulog::ErrorKind::Authentication,
        mirulog::ErrorKind::UnsupportedInput,
        mirulog::ErrorKind::MissingImage,
        mirulog::ErrorKind::Rejected
    };
    for (const auto kind : fatalKinds) {
        mirulog::testing::ManualClock clock;
        mirulog::testing::ScriptedBackend backend(clock);
        backend.pushError(kind);
        mirulog::RetryController retry(mirulog::RetryConfig{}, clock, backend.backendId());

        const auto outcome = retry.run([&]() { return backend.analyze({}); });
        QVERIFY(!outcome.succeeded());
        QCOMPARE(outcome.attempts, 1);
        QCOMPARE(outcome.retries, 0);
        QVERIFY(outcome.lastError.has_value());
        QCOMPARE(outcome.lastError->kind(), kind);
        QVERIFY(clock.sleeps.empty());
    }
}

void RetryControllerTests::testRetriesAreBounded()
{
    mirulog::testing::ManualClock clock;
    mirulog::testing::ScriptedBackend backend(clock);
    for (int i = 0; i < 10; ++i) {
        backend.pushError(mirulog::ErrorKind::Transient);
    }

    mirulog::RetryConfig config;
    config.maxRetries = 3;
    mirulog::RetryController retry(config, clock, backend.backendId());

    const auto outcome = retry.run([&]() { return backend.analyze({}); });
    QVERIFY(!outcome.succeeded());
    QCOMPARE(outcome.attempts, 4);
    QCOMPARE(outcome.retries, 3);
    QCOMPARE(outcome.lastError->kind(), mirulog::ErrorKind::Transient);
    QCOMPARE(backend.callTimes.size(), static_cast<size_t>(4));

    // maxRetries = 0 means a single attempt.
    mirulog::testing::ManualClock clock2;
    mirulog::testing::ScriptedBackend backend2(clock2);
    backend2.pushError(mirulog::ErrorKind::RateLimited, std::chrono::milliseconds(1s));
    config.maxRetries = 0;
    mirulog::RetryController once(config, clock2, backend2.backendId());
    const auto single = once.run([&]() { return backend2.analyze({}); });
    QVERIFY(!single.succeeded());
    QCOMPARE(single.attempts, 1);
}

void RetryControllerTests::testConnectionRefusedBound()
{
    mirulog::testing::ManualClock clock;
    mirulog::testing::ScriptedBackend backend(clock);
    for (int i = 0; i < 10; ++i) {
        backend.pushError(mirulog::ErrorKind::ConnectionRefused);
    }

    mirulog::RetryConfig config;
    config.maxRetries = 5;
    config.connectionRefusedRetries = 2;
    mirulog::RetryController retry(config, clock, backend.backendId());
    QCOMPARE(retry.retryBound(mirulog::ErrorKind::ConnectionRefused), 2);
    QCOMPARE(retry.retryBound(mirulog::ErrorKind::Transient), 5);

    const auto outcome = retry.run([&]() { return backend.analyze({}); });
    QVERIFY(!outcome.succeeded());
    QCOMPARE(outcome.attempts, 3);
    QCOMPARE(outcome.lastError->kind(), mirulog::ErrorKind::ConnectionRefused);
}

void RetryControllerTests::testBackoffSequence()
{
    QVERIFY(mirulog::RetryController::backoffDelay(0) == 2s);
    QVERIFY(mirulog::RetryController::backoffDelay(1) == 4s);
    QVERIFY(mirulog::RetryController::backoffDelay(2) == 8s);
    QVERIFY(mirulog::RetryController::backoffDelay(4) == 32s);
    QVERIFY(mirulog::RetryController::backoffDelay(5) == 60s);
    QVERIFY(mirulog::RetryController::backoffDelay(30) == 60s);

    mirulog::testing::ManualClock clock;
    mirulog::testing::ScriptedBackend backend(clock);
    backend.pushError(mirulog::ErrorKind::Transient);
    backend.pushError(mirulog::ErrorKind::Transient);
    mirulog::RetryController retry(mirulog::RetryConfig{}, clock, backend.backendId());

    const auto outcome = retry.run([&]() { return backend.analyze({}); });
    QVERIFY(outcome.succeeded());
    QCOMPARE(clock.sleeps.size(), static_cast<size_t>(2));
    QVERIFY(clock.sleeps[0] == 2s);
    QVERIFY(clock.sleeps[1] == 4s);
}

void RetryControllerTests::testRequestSpacing()
{
    mirulog::testing::ManualClock clock;
    mirulog::testing::ScriptedBackend backend(clock);

    mirulog::RetryConfig config;
    config.requestSpacingSeconds = 4.0;
    mirulog::RetryController retry(config, clock, backend.backendId());

    QVERIFY(retry.run([&]() { return backend.analyze({}); }).succeeded());
    clock.advance(1s);
    QVERIFY(retry.run([&]() { return backend.analyze({}); }).succeeded());
    clock.advance(10s);
    QVERIFY(retry.run([&]() { return backend.analyze({}); }).succeeded());

    QCOMPARE(backend.callTimes.size(), static_cast<size_t>(3));
    QVERIFY(backend.callTimes[1] - backend.callTimes[0] >= 4s);
    QVERIFY(backend.callTimes[2] - backend.callTimes[1] >= 10s);
    // Only the second call had to wait, and only for the remainder.
    QCOMPARE(clock.sleeps.size(), static_cast<size_t>(1));
    QVERIFY(clock.sleeps.front() == 3s);
}

QTEST_MAIN(RetryControllerTests)
#include "test_retry_controller.moc"
