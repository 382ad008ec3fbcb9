#pragma once

#include <stdexcept>
#include <string>

#include <QByteArray>

namespace mirulog {

enum class CaptureFailure {
    NoScreen,
    PermissionDenied,
    GrabFailed,
    EncodeFailed,
    WriteFailed
};

std::string toCaptureFailureString(CaptureFailure failure);

class CaptureError : public std::runtime_error {
public:
    CaptureError(CaptureFailure failure, const std::string &message)
        : std::runtime_error(message)
        , m_failure(failure)
    {
    }

    CaptureFailure failure() const { return m_failure; }

private:
    CaptureFailure m_failure;
};

// Grabs the whole desktop. Throws CaptureError.
class ScreenCapturer {
public:
    virtual ~ScreenCapturer() = default;
    virtual QByteArray capturePng() = 0;
};

} // namespace mirulog
