#pragma once

#include <chrono>
#include <string>

#include <QDateTime>
#include <QTimeZone>

namespace mirulog {

// Formats a timestamp in the given zone with a QDateTime format string,
// e.g. "yyyy-MM-dd" for capture and archive partitions.
inline std::string formatInZone(std::chrono::system_clock::time_point timestamp,
                                const QTimeZone &zone,
                                const QString &format)
{
    const qint64 ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count();
    const QTimeZone effective = zone.isValid() ? zone : QTimeZone::systemTimeZone();
    return QDateTime::fromMSecsSinceEpoch(ms, effective).toString(format).toStdString();
}

inline std::string partitionDate(std::chrono::system_clock::time_point timestamp,
                                 const QTimeZone &zone)
{
    return formatInZone(timestamp, zone, QStringLiteral("yyyy-MM-dd"));
}

} // namespace mirulog
