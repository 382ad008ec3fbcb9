#pragma once

#include "observer/screen_capturer.hpp"

namespace mirulog {

// Composes every attached screen into one image of the virtual desktop.
// Requires a QGuiApplication instance.
class QtScreenCapturer : public ScreenCapturer {
public:
    QByteArray capturePng() override;
};

} // namespace mirulog
