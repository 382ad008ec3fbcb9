#include "observer/observer_args.hpp"

namespace mirulog {

std::optional<ConfigOverrides> parseObserverArgs(const QStringList &args, QString *error)
{
    ConfigOverrides overrides;
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        const bool takesValue = arg == QStringLiteral("--capture-root")
            || arg == QStringLiteral("--archive-root");
        if (takesValue && i + 1 >= args.size()) {
            *error = QStringLiteral("Missing value for %1").arg(arg);
            return std::nullopt;
        }

        if (arg == QStringLiteral("--capture-root")) {
            overrides.captureRoot = args.at(++i).toStdString();
        } else if (arg == QStringLiteral("--archive-root")) {
            overrides.archiveRoot = args.at(++i).toStdString();
        } else if (arg == QStringLiteral("--trace")) {
            overrides.trace = true;
        } else {
            *error = QStringLiteral("Unknown argument: %1").arg(arg);
            return std::nullopt;
        }
    }
    return overrides;
}

QString observerUsageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  mirulog-observer [--capture-root PATH] [--archive-root PATH] [--trace]\n");
}

} // namespace mirulog
