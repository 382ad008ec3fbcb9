#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace mirulog {

// Returns nullopt and fills error on malformed arguments. args[0] is the
// program name.
std::optional<ConfigOverrides> parseObserverArgs(const QStringList &args, QString *error);

QString observerUsageText();

} // namespace mirulog
