#pragma once
#include <QtGlobal>

enum class ErrorKind : quint8 {
    StartupConfig,        // fatal at startup
    MalformedRequest,     // 400
    RequestTooLarge,      // 413
    UpstreamUnavailable,  // 502
    UpstreamTimeout,      // 502
    Internal              // 500
};

// Tag of a config-file value: key never given, given as null, or given with a value.
enum class ValuePresence : quint8 {
    Unmentioned, Null, Value
};
