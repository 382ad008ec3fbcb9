#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <QTimeZone>

#include "common/clock.hpp"
#include "common/config.hpp"
#include "observer/screen_capturer.hpp"
#include "observer/session_probes.hpp"
#include "store/capture_store.hpp"

namespace mirulog {

struct TickResult {
    SessionState state = SessionState::Idle;
    bool attempted = false;
    std::optional<std::int64_t> captureId;
};

// Interval-driven capture loop over the Idle/Active/Locked session states.
// Only Active ticks capture; skipped ticks are logged, never queued.
class CaptureScheduler {
public:
    CaptureScheduler(CaptureStore &store,
                     ScreenCapturer &capturer,
                     SessionLockProbe &lockProbe,
                     ActivityMonitor &activity,
                     WindowContextProbe &windowProbe,
                     Clock &clock,
                     const CaptureConfig &config,
                     std::string hostName,
                     QTimeZone timeZone);

    // Locked if the lock probe says so or fails; otherwise Active below the
    // idle threshold and Idle at or above it (or when the idle probe fails).
    SessionState evaluateState();

    // One interval: evaluate, then capture when Active. Capture failures are
    // logged and produce no record. Store failures propagate after the image
    // written for the tick has been removed.
    TickResult tick();

    // Ticks until shouldStop() returns true; checked before every tick and
    // after every sleep. Returns the number of records written.
    int run(const std::function<bool()> &shouldStop);

    // <capture-root>/<YYYY-MM-DD>/capture-<YYYYMMDD-HHMMSS>.png, before
    // collision handling.
    std::filesystem::path imagePathFor(std::chrono::system_clock::time_point timestamp) const;

private:
    void logSkip(SessionState state);

    CaptureStore &m_store;
    ScreenCapturer &m_capturer;
    SessionLockProbe &m_lockProbe;
    ActivityMonitor &m_activity;
    WindowContextProbe &m_windowProbe;
    Clock &m_clock;
    CaptureConfig m_config;
    std::string m_hostName;
    QTimeZone m_timeZone;

    std::optional<SessionState> m_lastSkipState;
    std::optional<std::chrono::steady_clock::time_point> m_lastSkipLog;
};

} // namespace mirulog
