#include "observer/session_probes.hpp"

#include <QFile>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace mirulog {

LoginctlLockProbe::LoginctlLockProbe(QString sessionId)
    : m_sessionId(std::move(sessionId))
{
}

QString LoginctlLockProbe::resolveSession()
{
    if (!m_sessionId.isEmpty()) {
        return m_sessionId;
    }
    const auto display = commandOutput(QStringLiteral("loginctl"),
                                       {QStringLiteral("show-user"),
                                        qEnvironmentVariable("USER"),
                                        QStringLiteral("-p"),
                                        QStringLiteral("Display"),
                                        QStringLiteral("--value")});
    if (!display || display->isEmpty()) {
        throw ProbeError("no logind session found for the current user");
    }
    m_sessionId = *display;
    MLOG_INFO(QStringLiteral("LoginctlLockProbe"),
              QStringLiteral("resolveSession"),
              QStringLiteral("lock_probe_session"),
              QStringLiteral("XDG_SESSION_ID not set"),
              QStringLiteral("loginctl show-user Display"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"session", m_sessionId.toStdString()}});
    return m_sessionId;
}

bool LoginctlLockProbe::isLocked()
{
    const QString session = resolveSession();
    const auto hint = commandOutput(QStringLiteral("loginctl"),
                                    {QStringLiteral("show-session"),
                                     session,
                                     QStringLiteral("-p"),
                                     QStringLiteral("LockedHint"),
                                     QStringLiteral("--value")});
    if (!hint) {
        throw ProbeError("loginctl show-session failed for session " + session.toStdString());
    }
    if (*hint == QStringLiteral("yes")) {
        return true;
    }
    if (*hint == QStringLiteral("no")) {
        return false;
    }
    throw ProbeError("unexpected LockedHint value: " + hint->toStdString());
}

std::chrono::milliseconds XPrintIdleMonitor::idleTime()
{
    const auto output = commandOutput(QStringLiteral("xprintidle"), {});
    if (!output) {
        throw ProbeError("xprintidle failed");
    }
    bool ok = false;
    const qlonglong ms = output->toLongLong(&ok);
    if (!ok || ms < 0) {
        throw ProbeError("xprintidle returned " + output->toStdString());
    }
    return std::chrono::milliseconds(ms);
}

WindowContext XdotoolWindowProbe::current()
{
    WindowContext context;

    const auto title = commandOutput(QStringLiteral("xdotool"),
                                     {QStringLiteral("getactivewindow"),
                                      QStringLiteral("getwindowname")});
    if (title && !title->isEmpty()) {
        context.title = title->toStdString();
    }

    const auto pid = commandOutput(QStringLiteral("xdotool"),
                                   {QStringLiteral("getactivewindow"),
                                    QStringLiteral("getwindowpid")});
    bool ok = false;
    const qlonglong pidValue = pid ? pid->toLongLong(&ok) : 0;
    if (ok && pidValue > 0) {
        QFile comm(QStringLiteral("/proc/%1/comm").arg(pidValue));
        if (comm.open(QIODevice::ReadOnly)) {
            const QString name = QString::fromUtf8(comm.readAll()).trimmed();
            if (!name.isEmpty()) {
                context.processName = name.toStdString();
            }
        }
    }
    return context;
}

} // namespace mirulog
