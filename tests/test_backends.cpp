#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <limits>

#include <nlohmann/json.hpp>

#include "analyzer/analysis_payload.hpp"
#include "analyzer/backend_factory.hpp"
#include "analyzer/gemini_backend.hpp"
#include "analyzer/local_llm_backend.hpp"
#include "common/config.hpp"
#include "test_fakes.hpp"

namespace {

mirulog::AnalysisRequest makeRequest()
{
    mirulog::AnalysisRequest request;
    request.imageBytes = QByteArray("fake png bytes");
    request.windowTitle = "Pull request #12 - browser";
    request.processName = "firefox";
    request.capturedAt = mirulog::fromIso8601Utc("2026-03-02T09:00:00Z");
    return request;
}

QByteArray geminiOk(const std::string &text)
{
    nlohmann::json body = {
        {"candidates", nlohmann::json::array({
            {{"content", {{"parts", nlohmann::json::array({{{"text", text}}})}}}}
        })}
    };
    return QByteArray::fromStdString(body.dump());
}

QByteArray chatOk(const std::string &content)
{
    nlohmann::json body = {
        {"choices", nlohmann::json::array({
            {{"message", {{"role", "assistant"}, {"content", content}}}}
        })}
    };
    return QByteArray::fromStdString(body.dump());
}

template <typename Fn>
std::optional<mirulog::BackendError> captureError(Fn &&fn)
{
    try {
        fn();
    } catch (const mirulog::BackendError &error) {
        return error;
    }
    return std::nullopt;
}

} // namespace

class BackendTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testPayloadParsing();
    void testPayloadSalvageAndDefaults();

    void testGeminiRequestShape();
    void testGeminiAuthenticationIsFatal();
    void testGeminiQuotaCarriesRetryHint();
    void testGeminiServerErrorIsTransient();
    void testOutOfRangeRetryHints();

    void testLocalAutoModelResolvedOnce();
    void testLocalResponseFormatFallback();
    void testLocalUnsupportedImage();
    void testLocalConnectionRefused();

    void testFactorySelectsBackend();

private:
    QTemporaryDir m_tempDir;
};

void BackendTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("LOG_DIR", (m_tempDir.path() + "/logs").toUtf8());
}

void BackendTests::testPayloadParsing()
{
    bool parsed = false;
    const auto fields = mirulog::parseAnalysisPayload(
        "```json\n{\"description\":\"Reviewing a PR\",\"primary_task\":\"Code review\","
        "\"tags\":[\"github\",3],\"confidence\":\"0.75\","
        "\"observed_urls\":[\"https://example.com/pr/12\"]}\n```",
        &parsed);

    QVERIFY(parsed);
    QCOMPARE(QString::fromStdString(fields.summary), QStringLiteral("Reviewing a PR"));
    QCOMPARE(QString::fromStdString(fields.primaryTask), QStringLiteral("Code review"));
    QCOMPARE(fields.tags.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(fields.tags[1]), QStringLiteral("3"));
    QCOMPARE(fields.confidence, 0.75);
    QCOMPARE(fields.observedUrls.size(), static_cast<size_t>(1));
    QVERIFY(fields.observedFiles.empty());
}

void BackendTests::testPayloadSalvageAndDefaults()
{
    bool parsed = false;
    auto fields = mirulog::parseAnalysisPayload(
        "Sure! Here is the result: {\"description\":\"Reading docs\"} Hope this helps.", &parsed);
    QVERIFY(parsed);
    QCOMPARE(QString::fromStdString(fields.summary), QStringLiteral("Reading docs"));
    QCOMPARE(QString::fromStdString(fields.primaryTask), QStringLiteral("Unclassified"));
    QCOMPARE(fields.confidence, 0.6);

    fields = mirulog::parseAnalysisPayload("  The user is writing an email.  ", &parsed);
    QVERIFY(!parsed);
    QCOMPARE(QString::fromStdString(fields.summary), QStringLiteral("The user is writing an email."));
    QCOMPARE(QString::fromStdString(fields.primaryTask), QStringLiteral("Unclassified"));
    QVERIFY(fields.tags.empty());
}

void BackendTests::testGeminiRequestShape()
{
    mirulog::testing::FakeTransport transport;
    transport.push(200, geminiOk(R"({"description":"Browsing","primary_task":"Research"})"));

    mirulog::GeminiConfig config;
    config.apiKey = "secret-key";
    config.model = "gemini-1.5-flash";
    config.endpoint = "https://example.invalid/v1beta";
    mirulog::GeminiBackend backend(config, transport);

    const auto raw = backend.analyze(makeRequest());
    QCOMPARE(QString::fromStdString(raw.model), QStringLiteral("gemini-1.5-flash"));
    QVERIFY(raw.text.find("Research") != std::string::npos);
    QCOMPARE(backend.defaultBatchLimit(), 20);

    QCOMPARE(transport.requests.size(), static_cast<size_t>(1));
    const auto &request = transport.requests.front();
    QCOMPARE(request.method, QByteArray("POST"));
    QCOMPARE(request.url.toString(),
             QStringLiteral("https://example.invalid/v1beta/models/gemini-1.5-flash:generateContent"));

    bool hasKey = false;
    for (const auto &header : request.headers) {
        if (header.first == "x-goog-api-key" && header.second == "secret-key") {
            hasKey = true;
        }
    }
    QVERIFY(hasKey);
    QVERIFY(!request.url.toString().contains(QStringLiteral("secret-key")));

    const auto body = nlohmann::json::parse(request.body.toStdString());
    const auto &parts = body["contents"][0]["parts"];
    QCOMPARE(parts.size(), static_cast<size_t>(2));
    QVERIFY(parts[0]["text"].get<std::string>().find("Window: Pull request #12 - browser")
            != std::string::npos);
    QCOMPARE(QString::fromStdString(parts[1]["inline_data"]["mime_type"].get<std::string>()),
             QStringLiteral("image/png"));
    QCOMPARE(QByteArray::fromStdString(parts[1]["inline_data"]["data"].get<std::string>()),
             QByteArray("fake png bytes").toBase64());
}

void BackendTests::testGeminiAuthenticationIsFatal()
{
    mirulog::testing::FakeTransport transport;
    transport.push(400, R"({"error":{"code":400,"message":"API key not valid. Please pass a valid API key.",
        "status":"INVALID_ARGUMENT","details":[{"reason":"API_KEY_INVALID"}]}})");
    transport.push(403, R"({"error":{"code":403,"message":"forbidden"}})");

    mirulog::GeminiConfig config;
    config.apiKey = "bad";
    mirulog::GeminiBackend backend(config, transport);

    for (int i = 0; i < 2; ++i) {
        const auto error = captureError([&]() { backend.analyze(makeRequest()); });
        QVERIFY(error.has_value());
        QCOMPARE(error->kind(), mirulog::ErrorKind::Authentication);
        QVERIFY(!error->isRetryable());
    }
}

void BackendTests::testGeminiQuotaCarriesRetryHint()
{
    mirulog::testing::FakeTransport transport;
    transport.push(429, R"({"error":{"code":429,"status":"RESOURCE_EXHAUSTED","message":"quota",
        "details":[{"@type":"type.googleapis.com/google.rpc.RetryInfo","retryDelay":"10s"}]}})");
    transport.push(429, "{}", {{"Retry-After", "7"}});

    mirulog::GeminiConfig config;
    config.apiKey = "key";
    mirulog::GeminiBackend backend(config, transport);

    auto error = captureError([&]() { backend.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QCOMPARE(error->kind(), mirulog::ErrorKind::RateLimited);
    QVERIFY(error->retryAfter().has_value());
    QVERIFY(*error->retryAfter() == std::chrono::seconds(10));

    error = captureError([&]() { backend.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QVERIFY(error->retryAfter().has_value());
    QVERIFY(*error->retryAfter() == std::chrono::seconds(7));
}

void BackendTests::testGeminiServerErrorIsTransient()
{
    mirulog::testing::FakeTransport transport;
    transport.push(503, R"({"error":{"code":503,"status":"UNAVAILABLE","message":"overloaded"}})");
    transport.pushError(mirulog::TransportError::Timeout);

    mirulog::GeminiConfig config;
    config.apiKey = "key";
    mirulog::GeminiBackend backend(config, transport);

    for (int i = 0; i < 2; ++i) {
        const auto error = captureError([&]() { backend.analyze(makeRequest()); });
        QVERIFY(error.has_value());
        QCOMPARE(error->kind(), mirulog::ErrorKind::Transient);
        QVERIFY(error->isRetryable());
    }
}

void BackendTests::testOutOfRangeRetryHints()
{
    QVERIFY(!mirulog::retryHintFromSeconds(std::numeric_limits<double>::infinity()).has_value());
    QVERIFY(!mirulog::retryHintFromSeconds(std::numeric_limits<double>::quiet_NaN()).has_value());
    QVERIFY(!mirulog::retryHintFromSeconds(-1.0).has_value());
    QVERIFY(*mirulog::retryHintFromSeconds(1e300) == mirulog::kMaxRetryHint);
    QVERIFY(*mirulog::retryHintFromSeconds(2.5) == std::chrono::milliseconds(2500));

    mirulog::testing::FakeTransport geminiTransport;
    geminiTransport.push(429, "{}", {{"Retry-After", "inf"}});
    geminiTransport.push(429, "{}", {{"Retry-After", "1e300"}});
    // A bad header still lets RetryInfo supply the hint.
    geminiTransport.push(429, R"({"error":{"code":429,"status":"RESOURCE_EXHAUSTED","message":"quota",
        "details":[{"@type":"type.googleapis.com/google.rpc.RetryInfo","retryDelay":"4s"}]}})",
        {{"Retry-After", "inf"}});

    mirulog::GeminiConfig geminiConfig;
    geminiConfig.apiKey = "key";
    mirulog::GeminiBackend gemini(geminiConfig, geminiTransport);

    auto error = captureError([&]() { gemini.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QCOMPARE(error->kind(), mirulog::ErrorKind::RateLimited);
    QVERIFY(!error->retryAfter().has_value());

    error = captureError([&]() { gemini.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QVERIFY(error->retryAfter().has_value());
    QVERIFY(*error->retryAfter() == mirulog::kMaxRetryHint);

    error = captureError([&]() { gemini.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QVERIFY(error->retryAfter().has_value());
    QVERIFY(*error->retryAfter() == std::chrono::seconds(4));

    mirulog::testing::FakeTransport localTransport;
    localTransport.push(429, R"({"error":"busy"})", {{"Retry-After", "inf"}});
    localTransport.push(429, R"({"error":"busy"})", {{"Retry-After", "1e300"}});

    mirulog::LocalLlmConfig localConfig;
    localConfig.baseUrl = "http://127.0.0.1:1234/v1";
    localConfig.model = "llava";
    mirulog::LocalLlmBackend local(localConfig, localTransport);

    error = captureError([&]() { local.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QCOMPARE(error->kind(), mirulog::ErrorKind::RateLimited);
    QVERIFY(!error->retryAfter().has_value());

    error = captureError([&]() { local.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QVERIFY(error->retryAfter().has_value());
    QVERIFY(*error->retryAfter() == mirulog::kMaxRetryHint);
}

void BackendTests::testLocalAutoModelResolvedOnce()
{
    mirulog::testing::FakeTransport transport;
    transport.push(200, R"({"data":[{"id":"qwen2-vl-7b"},{"id":"other"}]})");
    transport.push(200, chatOk(R"({"description":"Terminal work"})"));
    transport.push(200, chatOk(R"({"description":"More terminal work"})"));

    mirulog::LocalLlmConfig config;
    config.baseUrl = "http://127.0.0.1:1234/v1";
    config.model = "auto";
    mirulog::LocalLlmBackend backend(config, transport);
    QCOMPARE(backend.defaultBatchLimit(), 0);

    auto raw = backend.analyze(makeRequest());
    QCOMPARE(QString::fromStdString(raw.model), QStringLiteral("qwen2-vl-7b"));
    raw = backend.analyze(makeRequest());
    QCOMPARE(QString::fromStdString(raw.model), QStringLiteral("qwen2-vl-7b"));
    QCOMPARE(QString::fromStdString(backend.modelName()), QStringLiteral("qwen2-vl-7b"));

    QCOMPARE(transport.requests.size(), static_cast<size_t>(3));
    QCOMPARE(transport.requests[0].url.toString(), QStringLiteral("http://127.0.0.1:1234/v1/models"));
    QCOMPARE(transport.requests[1].url.toString(),
             QStringLiteral("http://127.0.0.1:1234/v1/chat/completions"));

    const auto body = nlohmann::json::parse(transport.requests[1].body.toStdString());
    QCOMPARE(QString::fromStdString(body["model"].get<std::string>()), QStringLiteral("qwen2-vl-7b"));
    QCOMPARE(QString::fromStdString(body["response_format"]["type"].get<std::string>()),
             QStringLiteral("json_object"));
    const std::string url = body["messages"][1]["content"][1]["image_url"]["url"].get<std::string>();
    QVERIFY(url.rfind("data:image/png;base64,", 0) == 0);
}

void BackendTests::testLocalResponseFormatFallback()
{
    mirulog::testing::FakeTransport transport;
    transport.push(400, R"({"error":"'response_format.type' must be 'json_schema'"})");
    transport.push(200, chatOk(R"({"description":"Ok"})"));

    mirulog::LocalLlmConfig config;
    config.model = "llava";
    mirulog::LocalLlmBackend backend(config, transport);

    const auto raw = backend.analyze(makeRequest());
    QVERIFY(raw.text.find("Ok") != std::string::npos);
    QCOMPARE(transport.requests.size(), static_cast<size_t>(2));
    const auto retried = nlohmann::json::parse(transport.requests[1].body.toStdString());
    QVERIFY(!retried.contains("response_format"));
}

void BackendTests::testLocalUnsupportedImage()
{
    mirulog::testing::FakeTransport transport;
    transport.push(400, R"({"error":"Model does not support images. Please use a model that does."})");

    mirulog::LocalLlmConfig config;
    config.model = "text-only";
    mirulog::LocalLlmBackend backend(config, transport);

    const auto error = captureError([&]() { backend.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QCOMPARE(error->kind(), mirulog::ErrorKind::UnsupportedInput);
    QVERIFY(!error->isRetryable());
    // No response_format fallback when the model cannot take images.
    QCOMPARE(transport.requests.size(), static_cast<size_t>(1));
}

void BackendTests::testLocalConnectionRefused()
{
    mirulog::testing::FakeTransport transport;
    transport.pushError(mirulog::TransportError::ConnectionRefused);
    transport.push(200, R"({"data":[{"id":"late-model"}]})");
    transport.push(200, chatOk("{}"));

    mirulog::LocalLlmConfig config;
    config.model = "local-model";
    mirulog::LocalLlmBackend backend(config, transport);

    const auto error = captureError([&]() { backend.analyze(makeRequest()); });
    QVERIFY(error.has_value());
    QCOMPARE(error->kind(), mirulog::ErrorKind::ConnectionRefused);
    QVERIFY(error->isRetryable());

    // Discovery is attempted again once the server is up.
    const auto raw = backend.analyze(makeRequest());
    QCOMPARE(QString::fromStdString(raw.model), QStringLiteral("late-model"));
}

void BackendTests::testFactorySelectsBackend()
{
    mirulog::testing::FakeTransport transport;

    QProcessEnvironment env;
    env.insert(QStringLiteral("ANALYZER_BACKEND"), QStringLiteral("local"));
    env.insert(QStringLiteral("ARCHIVE_ROOT"), m_tempDir.path() + "/archive");
    auto backend = mirulog::makeBackend(mirulog::loadConfig(env), transport);
    QCOMPARE(QString::fromStdString(backend->backendId()), QStringLiteral("local"));

    env.insert(QStringLiteral("ANALYZER_BACKEND"), QStringLiteral("gemini"));
    bool threw = false;
    try {
        mirulog::makeBackend(mirulog::loadConfig(env), transport);
    } catch (const mirulog::ConfigError &) {
        threw = true;
    }
    QVERIFY(threw);

    env.insert(QStringLiteral("GEMINI_API_KEY"), QStringLiteral("key"));
    backend = mirulog::makeBackend(mirulog::loadConfig(env), transport);
    QCOMPARE(QString::fromStdString(backend->backendId()), QStringLiteral("gemini"));
}

QTEST_MAIN(BackendTests)
#include "test_backends.moc"
