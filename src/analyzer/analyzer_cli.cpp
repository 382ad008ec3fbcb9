#include "analyzer/analyzer_cli.hpp"

#include <iostream>

#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>

#include "analyzer/backend_factory.hpp"
#include "analyzer/batch_engine.hpp"
#include "analyzer/image_lifecycle.hpp"
#include "analyzer/retry_controller.hpp"
#include "common/cli_args.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/mirulog_version.hpp"
#include "store/capture_store.hpp"

namespace mirulog {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  mirulog-analyzer [--limit N] [--until-empty] [--requeue-failed]\n"
        "                   [--capture-root PATH] [--archive-root PATH] [--trace]\n"
        "  mirulog-analyzer --single PATH [--trace]\n");
}

int runSingle(const AppConfig &config,
              AnalysisBackend &backend,
              RetryController &retry,
              const std::string &imagePath)
{
    QFile image(QString::fromStdString(imagePath));
    if (!image.open(QIODevice::ReadOnly)) {
        std::cerr << "Cannot read image: " << imagePath << std::endl;
        return 1;
    }

    AnalysisRequest request;
    request.imageBytes = image.readAll();
    request.windowTitle = QFileInfo(image).fileName().toStdString();
    request.processName = "mirulog-analyzer";
    request.capturedAt = std::chrono::system_clock::now();
    request.extraContext = "Host: " + config.hostName;

    const RetryOutcome outcome = retry.run([&]() {
        return backend.analyze(request);
    });
    if (!outcome.succeeded()) {
        std::cerr << "Analysis failed after " << outcome.attempts << " attempt(s): "
                  << (outcome.lastError ? outcome.lastError->what() : "unknown error")
                  << std::endl;
        return 1;
    }

    std::cout << outcome.analysis->text << std::endl;
    return 0;
}

} // namespace

std::optional<AnalyzerOptions> parseAnalyzerArgs(const QStringList &args, QString *error)
{
    AnalyzerOptions options;
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        const bool takesValue = arg == QStringLiteral("--limit")
            || arg == QStringLiteral("--capture-root")
            || arg == QStringLiteral("--archive-root")
            || arg == QStringLiteral("--single");
        if (takesValue && i + 1 >= args.size()) {
            *error = QStringLiteral("Missing value for %1").arg(arg);
            return std::nullopt;
        }

        if (arg == QStringLiteral("--limit")) {
            bool ok = false;
            const int limit = args.at(++i).toInt(&ok);
            if (!ok || limit <= 0) {
                *error = QStringLiteral("--limit expects a positive integer");
                return std::nullopt;
            }
            options.limit = limit;
        } else if (arg == QStringLiteral("--capture-root")) {
            options.captureRoot = args.at(++i).toStdString();
        } else if (arg == QStringLiteral("--archive-root")) {
            options.archiveRoot = args.at(++i).toStdString();
        } else if (arg == QStringLiteral("--single")) {
            options.singleImage = args.at(++i).toStdString();
        } else if (arg == QStringLiteral("--until-empty")) {
            options.untilEmpty = true;
        } else if (arg == QStringLiteral("--requeue-failed")) {
            options.requeueFailed = true;
        } else if (arg == QStringLiteral("--trace")) {
            options.trace = true;
        } else {
            *error = QStringLiteral("Unknown argument: %1").arg(arg);
            return std::nullopt;
        }
    }
    return options;
}

AnalyzerCli::AnalyzerCli(QProcessEnvironment env, HttpTransport &transport, Clock &clock)
    : m_env(std::move(env))
    , m_transport(transport)
    , m_clock(clock)
{
}

int AnalyzerCli::run(const QStringList &args)
{
    QString parseError;
    const auto options = parseAnalyzerArgs(args, &parseError);
    if (!options) {
        std::cerr << parseError.toStdString() << "\n" << usageText().toStdString();
        return 1;
    }

    ConfigOverrides overrides;
    overrides.captureRoot = options->captureRoot;
    overrides.archiveRoot = options->archiveRoot;
    overrides.trace = options->trace;

    AppConfig config;
    try {
        config = loadConfig(m_env, overrides);
    } catch (const ConfigError &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    }

    mirulog::logging::initLogging(QStringLiteral("mirulog-analyzer"),
                                  config.logging.directory,
                                  config.logging.level,
                                  config.logging.trace);
    MLOG_INFO(QStringLiteral("AnalyzerCli"),
              QStringLiteral("run"),
              QStringLiteral("analyzer_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"version", MIRULOG_VERSION},
                             {"host", config.hostName},
                             {"archiveRoot", config.capture.archiveRoot.string()},
                             {"untilEmpty", options->untilEmpty},
                             {"limit", options->limit ? *options->limit : 0}});

    try {
        auto backend = makeBackend(config, m_transport);
        RetryController retry(config.analyzer.retry, m_clock, backend->backendId());

        if (options->singleImage) {
            return runSingle(config, *backend, retry, *options->singleImage);
        }

        CaptureStore store(config.databasePath());
        if (options->requeueFailed) {
            const int requeued = store.requeueFailed();
            MLOG_INFO(QStringLiteral("AnalyzerCli"),
                      QStringLiteral("run"),
                      QStringLiteral("failed_requeued"),
                      QStringLiteral("--requeue-failed"),
                      QStringLiteral("failed -> pending"),
                      mirulog::logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"count", requeued}});
        }

        ImageLifecycleManager lifecycle(store, config.capture, config.hostName, config.timeZone);
        const std::string leaseOwner = config.hostName + ":"
            + std::to_string(QCoreApplication::applicationPid());
        BatchEngine engine(store, *backend, retry, lifecycle, m_clock,
                           config.analyzer.leaseDuration, leaseOwner);

        const std::optional<int> limit = options->limit ? options->limit : config.analyzer.batchLimit;
        BatchStats totals;
        if (options->untilEmpty) {
            const DrainStats drained = engine.drain(limit);
            totals = drained.totals;
        } else {
            totals = engine.runBatch(limit);
        }

        std::cout << "analyzed=" << totals.analyzed
                  << " failed=" << totals.failed
                  << " pending=" << store.pendingCount() << std::endl;
        return 0;
    } catch (const ConfigError &ex) {
        MLOG_ERROR(QStringLiteral("AnalyzerCli"),
                   QStringLiteral("run"),
                   QStringLiteral("analyzer_config_error"),
                   QStringLiteral("backend configuration incomplete"),
                   QStringLiteral("exit"),
                   mirulog::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}});
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    } catch (const StoreError &ex) {
        MLOG_ERROR(QStringLiteral("AnalyzerCli"),
                   QStringLiteral("run"),
                   QStringLiteral("analyzer_store_error"),
                   QStringLiteral("persistence failed"),
                   QStringLiteral("exit"),
                   mirulog::logging::defaultWho(),
                   mirulog::logging::currentCorrelationId(),
                   nlohmann::json{{"error", ex.what()}});
        std::cerr << "Store error: " << ex.what() << std::endl;
        return 2;
    } catch (const LifecycleError &ex) {
        MLOG_ERROR(QStringLiteral("AnalyzerCli"),
                   QStringLiteral("run"),
                   QStringLiteral("analyzer_lifecycle_error"),
                   QStringLiteral("image lifecycle refused a capture"),
                   QStringLiteral("exit"),
                   mirulog::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}});
        std::cerr << "Lifecycle error: " << ex.what() << std::endl;
        return 2;
    }
}

} // namespace mirulog
