#pragma once

namespace mirulog {

enum class CaptureStatus {
    Pending,
    Analyzing,
    Analyzed,
    Failed
};

enum class SessionState {
    Idle,
    Active,
    Locked
};

enum class BackendKind {
    Gemini,
    Local
};

enum class LifecyclePolicy {
    Delete,
    Archive
};

enum class ImageDisposition {
    None,
    Deleted,
    Archived,
    Missing,
    Kept
};

} // namespace mirulog
