#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    // Input format
    MalformedContainer,
    UnsupportedEncoding,
    UnsupportedChannelLayout,
    UnsupportedSampleRate,
    TruncatedData,
    // Engine
    EngineInitFailed,
    EngineInferenceFailed,
    // Resources and caller input
    OutOfMemory,
    FileUnreadable,
    InvalidRequest,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

std::string_view to_string(ErrorKind kind);

// "Your audio is wrong": fixable by supplying corrected input.
bool is_format_error(ErrorKind kind);

// "The engine could not process valid audio."
bool is_engine_error(ErrorKind kind);
