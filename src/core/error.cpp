#include "error.hpp"

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedContainer: return "malformed container";
        case ErrorKind::UnsupportedEncoding: return "unsupported encoding";
        case ErrorKind::UnsupportedChannelLayout: return "unsupported channel layout";
        case ErrorKind::UnsupportedSampleRate: return "unsupported sample rate";
        case ErrorKind::TruncatedData: return "truncated data";
        case ErrorKind::EngineInitFailed: return "engine init failed";
        case ErrorKind::EngineInferenceFailed: return "engine inference failed";
        case ErrorKind::OutOfMemory: return "out of memory";
        case ErrorKind::FileUnreadable: return "file unreadable";
        case ErrorKind::InvalidRequest: return "invalid request";
    }
    return "unknown error";
}

bool is_format_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedContainer:
        case ErrorKind::UnsupportedEncoding:
        case ErrorKind::UnsupportedChannelLayout:
        case ErrorKind::UnsupportedSampleRate:
        case ErrorKind::TruncatedData:
            return true;
        default:
            return false;
    }
}

bool is_engine_error(ErrorKind kind) {
    return kind == ErrorKind::EngineInitFailed || kind == ErrorKind::EngineInferenceFailed;
}
