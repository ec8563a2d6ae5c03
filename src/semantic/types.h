#pragma once
#include <QtGlobal>

enum class FrameType : quint8 {
    Started,        // backend opened the response / client role announcement
    Delta,          // incremental output text
    ItemCompleted,  // a finished output item (full text snapshot)
    Finished,       // terminal success
    Failed,         // terminal failure
    Ignored         // event type with no mapping
};

enum class SegmentKind : quint8 {
    Text, Opaque
};

enum class ErrorKind : quint8 {
    InvalidInput,    // 400
    Unauthorized,    // 401
    Forbidden,       // 403
    RateLimited,     // 429
    Unavailable,     // 503
    Timeout,         // 504
    BadGateway,      // 502
    Internal         // 500
};

enum class StopCause : quint8 {
    Completed, Length
};

enum class FinishReason : quint8 {
    Unset, Stop, Length, Error
};

enum class ReasoningEffort : quint8 {
    None, Low, Medium, High, XHigh
};
