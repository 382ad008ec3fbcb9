#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include <QString>

namespace mirulog {

class ProbeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reports whether the desktop session is locked. Throws ProbeError when the
// state cannot be determined.
class SessionLockProbe {
public:
    virtual ~SessionLockProbe() = default;
    virtual bool isLocked() = 0;
};

// Time since the last keyboard or pointer input. Throws ProbeError.
class ActivityMonitor {
public:
    virtual ~ActivityMonitor() = default;
    virtual std::chrono::milliseconds idleTime() = 0;
};

struct WindowContext {
    std::string title = "Unknown";
    std::string processName = "Unknown";
};

// Foreground window title and owning process. Never throws; unknown values
// are reported as "Unknown".
class WindowContextProbe {
public:
    virtual ~WindowContextProbe() = default;
    virtual WindowContext current() = 0;
};

// logind LockedHint for the given session. An empty session id falls back to
// the display session of the current user.
class LoginctlLockProbe : public SessionLockProbe {
public:
    explicit LoginctlLockProbe(QString sessionId);
    bool isLocked() override;

private:
    QString resolveSession();

    QString m_sessionId;
};

// Used when lock checking is turned off in the configuration.
class DisabledLockProbe : public SessionLockProbe {
public:
    bool isLocked() override { return false; }
};

// X11 idle time through xprintidle.
class XPrintIdleMonitor : public ActivityMonitor {
public:
    std::chrono::milliseconds idleTime() override;
};

// X11 active window through xdotool, process name from /proc/<pid>/comm.
class XdotoolWindowProbe : public WindowContextProbe {
public:
    WindowContext current() override;
};

} // namespace mirulog
