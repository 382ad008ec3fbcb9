#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>

#include <QGuiApplication>
#include <QProcessEnvironment>

#include "common/cli_args.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/mirulog_version.hpp"
#include "observer/capture_scheduler.hpp"
#include "observer/observer_args.hpp"
#include "observer/qt_screen_capturer.hpp"
#include "observer/session_probes.hpp"
#include "store/capture_store.hpp"

namespace {

std::atomic<bool> g_stopRequested{false};

void handleStopSignal(int)
{
    g_stopRequested.store(true);
}

// Sleeps in short slices so a stop signal ends the interval early.
class StopAwareClock : public mirulog::SystemClock {
public:
    void sleepFor(std::chrono::milliseconds duration) override
    {
        constexpr std::chrono::milliseconds slice{250};
        while (duration.count() > 0 && !g_stopRequested.load()) {
            const auto step = std::min(duration, slice);
            mirulog::SystemClock::sleepFor(step);
            duration -= step;
        }
    }
};

} // namespace

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    QString parseError;
    const auto overrides = mirulog::parseObserverArgs(mirulog::toArgList(argc, argv), &parseError);
    if (!overrides) {
        std::cerr << parseError.toStdString() << "\n"
                  << mirulog::observerUsageText().toStdString();
        return 1;
    }

    mirulog::AppConfig config;
    try {
        config = mirulog::loadConfig(QProcessEnvironment::systemEnvironment(), *overrides);
    } catch (const mirulog::ConfigError &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    }

    mirulog::logging::initLogging(QStringLiteral("mirulog-observer"),
                                  config.logging.directory,
                                  config.logging.level,
                                  config.logging.trace);
    MLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("observer_start"),
              QStringLiteral("process_start"),
              QStringLiteral("cli"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"version", MIRULOG_VERSION},
                             {"host", config.hostName},
                             {"captureRoot", config.capture.captureRoot.string()},
                             {"database", config.databasePath().string()},
                             {"intervalSeconds", config.capture.interval.count()},
                             {"lockCheck", config.capture.lockCheckEnabled}});

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    try {
        mirulog::CaptureStore store(config.databasePath());
        mirulog::QtScreenCapturer capturer;
        mirulog::LoginctlLockProbe loginctlProbe(qEnvironmentVariable("XDG_SESSION_ID"));
        mirulog::DisabledLockProbe disabledProbe;
        mirulog::SessionLockProbe &lockProbe = config.capture.lockCheckEnabled
            ? static_cast<mirulog::SessionLockProbe &>(loginctlProbe)
            : static_cast<mirulog::SessionLockProbe &>(disabledProbe);
        mirulog::XPrintIdleMonitor activity;
        mirulog::XdotoolWindowProbe windowProbe;
        StopAwareClock clock;

        mirulog::CaptureScheduler scheduler(store, capturer, lockProbe, activity, windowProbe,
                                            clock, config.capture, config.hostName,
                                            config.timeZone);
        const int stored = scheduler.run([]() {
            return g_stopRequested.load();
        });

        MLOG_INFO(QStringLiteral("main"),
                  QStringLiteral("main"),
                  QStringLiteral("observer_stop"),
                  QStringLiteral("stop signal received"),
                  QStringLiteral("SIGINT/SIGTERM"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"stored", stored}});
    } catch (const mirulog::StoreError &ex) {
        MLOG_ERROR(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("observer_store_error"),
                   QStringLiteral("persistence failed"),
                   QStringLiteral("exit"),
                   mirulog::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}});
        std::cerr << "Store error: " << ex.what() << std::endl;
        return 2;
    }

    return 0;
}
