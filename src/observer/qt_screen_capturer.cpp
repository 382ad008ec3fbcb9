#include "observer/qt_screen_capturer.hpp"

#include <QBuffer>
#include <QGuiApplication>
#include <QImage>
#include <QPainter>
#include <QPixmap>
#include <QScreen>

namespace mirulog {

QByteArray QtScreenCapturer::capturePng()
{
    const QList<QScreen *> screens = QGuiApplication::screens();
    if (screens.isEmpty()) {
        throw CaptureError(CaptureFailure::NoScreen, "no screens attached");
    }

    QRect desktop;
    for (QScreen *screen : screens) {
        desktop = desktop.united(screen->geometry());
    }

    QImage composed(desktop.size(), QImage::Format_RGB32);
    composed.fill(Qt::black);
    {
        QPainter painter(&composed);
        for (QScreen *screen : screens) {
            const QPixmap grab = screen->grabWindow(0);
            if (grab.isNull()) {
                // Wayland compositors return a null pixmap instead of an error.
                throw CaptureError(CaptureFailure::PermissionDenied,
                                   "screen grab refused for " + screen->name().toStdString());
            }
            const QRect target = screen->geometry().translated(-desktop.topLeft());
            painter.drawPixmap(target, grab);
        }
    }

    QByteArray png;
    QBuffer buffer(&png);
    if (!buffer.open(QIODevice::WriteOnly) || !composed.save(&buffer, "PNG")) {
        throw CaptureError(CaptureFailure::EncodeFailed, "PNG encoding failed");
    }
    return png;
}

} // namespace mirulog
