#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include <QTimeZone>

#include "common/config.hpp"
#include "common/models.hpp"
#include "store/capture_store.hpp"

namespace mirulog {

class LifecycleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LifecycleOutcome {
    ImageDisposition disposition = ImageDisposition::None;
    std::string archivedPath;
};

// Applies the configured delete/archive policy to the image of a capture that
// is already committed as analyzed. Filesystem failures leave the image in
// place and are reported as Kept; they never touch the capture status.
class ImageLifecycleManager {
public:
    ImageLifecycleManager(CaptureStore &store,
                          const CaptureConfig &config,
                          std::string hostName,
                          QTimeZone timeZone);

    // Throws LifecycleError if the stored status is not analyzed, and
    // StoreError if the disposition cannot be recorded.
    LifecycleOutcome apply(std::int64_t captureId);

    // <archive-root>/<date>/[<host>/]<file>, before collision handling.
    std::filesystem::path archiveTarget(const CaptureRecord &record) const;

private:
    LifecycleOutcome deleteImage(const CaptureRecord &record);
    LifecycleOutcome archiveImage(const CaptureRecord &record);

    CaptureStore &m_store;
    CaptureConfig m_config;
    std::string m_hostName;
    QTimeZone m_timeZone;
};

} // namespace mirulog
