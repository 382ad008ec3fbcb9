#include "observer/capture_scheduler.hpp"

#include <system_error>

#include <QCryptographicHash>
#include <QFile>

#include "common/fs_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_format.hpp"

namespace mirulog {

namespace {

constexpr std::chrono::seconds kSkipLogInterval{60};

} // namespace

std::string toCaptureFailureString(CaptureFailure failure)
{
    switch (failure) {
    case CaptureFailure::NoScreen:
        return "no_screen";
    case CaptureFailure::PermissionDenied:
        return "permission_denied";
    case CaptureFailure::GrabFailed:
        return "grab_failed";
    case CaptureFailure::EncodeFailed:
        return "encode_failed";
    case CaptureFailure::WriteFailed:
        return "write_failed";
    }
    return "grab_failed";
}

CaptureScheduler::CaptureScheduler(CaptureStore &store,
                                   ScreenCapturer &capturer,
                                   SessionLockProbe &lockProbe,
                                   ActivityMonitor &activity,
                                   WindowContextProbe &windowProbe,
                                   Clock &clock,
                                   const CaptureConfig &config,
                                   std::string hostName,
                                   QTimeZone timeZone)
    : m_store(store)
    , m_capturer(capturer)
    , m_lockProbe(lockProbe)
    , m_activity(activity)
    , m_windowProbe(windowProbe)
    , m_clock(clock)
    , m_config(config)
    , m_hostName(std::move(hostName))
    , m_timeZone(std::move(timeZone))
{
}

SessionState CaptureScheduler::evaluateState()
{
    try {
        if (m_lockProbe.isLocked()) {
            return SessionState::Locked;
        }
    } catch (const ProbeError &ex) {
        MLOG_WARN(QStringLiteral("CaptureScheduler"),
                  QStringLiteral("evaluateState"),
                  QStringLiteral("lock_probe_failed"),
                  QStringLiteral("session lock state unknown"),
                  QStringLiteral("treating session as locked"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"error", ex.what()}});
        return SessionState::Locked;
    }

    try {
        const auto idle = m_activity.idleTime();
        return idle < m_config.idleThreshold ? SessionState::Active : SessionState::Idle;
    } catch (const ProbeError &ex) {
        MLOG_WARN(QStringLiteral("CaptureScheduler"),
                  QStringLiteral("evaluateState"),
                  QStringLiteral("idle_probe_failed"),
                  QStringLiteral("time since last input unknown"),
                  QStringLiteral("treating session as idle"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"error", ex.what()}});
        return SessionState::Idle;
    }
}

void CaptureScheduler::logSkip(SessionState state)
{
    const auto now = m_clock.monotonicNow();
    const bool changed = !m_lastSkipState || *m_lastSkipState != state;
    const bool due = !m_lastSkipLog || now - *m_lastSkipLog >= kSkipLogInterval;
    if (!changed && !due) {
        return;
    }
    m_lastSkipState = state;
    m_lastSkipLog = now;
    MLOG_INFO(QStringLiteral("CaptureScheduler"),
              QStringLiteral("tick"),
              QStringLiteral("capture_skipped"),
              QStringLiteral("session not active"),
              QStringLiteral("interval tick"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"state", toSessionStateString(state)}});
}

std::filesystem::path CaptureScheduler::imagePathFor(std::chrono::system_clock::time_point timestamp) const
{
    const std::string stamp = formatInZone(timestamp, m_timeZone, QStringLiteral("yyyyMMdd-HHmmss"));
    return m_config.captureRoot / partitionDate(timestamp, m_timeZone) / ("capture-" + stamp + ".png");
}

TickResult CaptureScheduler::tick()
{
    TickResult result;
    result.state = evaluateState();
    if (result.state != SessionState::Active) {
        logSkip(result.state);
        return result;
    }
    m_lastSkipState.reset();
    result.attempted = true;

    const auto capturedAt = m_clock.now();
    const WindowContext window = m_windowProbe.current();

    std::filesystem::path imagePath;
    QByteArray png;
    try {
        png = m_capturer.capturePng();
        if (png.isEmpty()) {
            throw CaptureError(CaptureFailure::EncodeFailed, "capturer returned no data");
        }

        imagePath = imagePathFor(capturedAt);
        std::error_code ec;
        std::filesystem::create_directories(imagePath.parent_path(), ec);
        if (ec) {
            throw CaptureError(CaptureFailure::WriteFailed,
                               "cannot create " + imagePath.parent_path().string() + ": " + ec.message());
        }
        imagePath = uniquePath(imagePath);

        QFile file(QString::fromStdString(imagePath.string()));
        if (!file.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
            throw CaptureError(CaptureFailure::WriteFailed,
                               "cannot write " + imagePath.string() + ": " + file.errorString().toStdString());
        }
        if (file.write(png) != png.size()) {
            file.close();
            file.remove();
            throw CaptureError(CaptureFailure::WriteFailed, "short write to " + imagePath.string());
        }
    } catch (const CaptureError &ex) {
        MLOG_WARN(QStringLiteral("CaptureScheduler"),
                  QStringLiteral("tick"),
                  QStringLiteral("capture_failed"),
                  QStringLiteral("screen capture did not produce an image"),
                  QStringLiteral("retry on next interval"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"failure", toCaptureFailureString(ex.failure())},
                                 {"error", ex.what()}});
        return result;
    }

    CaptureRecord record;
    record.capturedAt = capturedAt;
    record.windowTitle = window.title;
    record.processName = window.processName;
    record.contentHash = QCryptographicHash::hash(png, QCryptographicHash::Sha256).toHex().toStdString();
    record.imagePath = imagePath.string();
    record.hostName = m_hostName;
    record.sessionState = SessionState::Active;

    try {
        result.captureId = m_store.addCapture(record);
    } catch (const StoreError &ex) {
        std::error_code ec;
        std::filesystem::remove(imagePath, ec);
        MLOG_ERROR(QStringLiteral("CaptureScheduler"),
                   QStringLiteral("tick"),
                   QStringLiteral("capture_persist_failed"),
                   QStringLiteral("record could not be stored"),
                   QStringLiteral("image removed, stopping"),
                   mirulog::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"image", imagePath.string()},
                                  {"error", ex.what()}});
        throw;
    }

    MLOG_INFO(QStringLiteral("CaptureScheduler"),
              QStringLiteral("tick"),
              QStringLiteral("capture_stored"),
              QStringLiteral("session active"),
              QStringLiteral("interval tick"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"captureId", *result.captureId},
                             {"image", record.imagePath},
                             {"window", record.windowTitle},
                             {"process", record.processName}});
    return result;
}

int CaptureScheduler::run(const std::function<bool()> &shouldStop)
{
    int stored = 0;
    while (!shouldStop()) {
        if (tick().captureId) {
            ++stored;
        }
        if (shouldStop()) {
            break;
        }
        m_clock.sleepFor(m_config.interval);
    }
    return stored;
}

} // namespace mirulog
