#pragma once

#include "error.hpp"
#include "transcription.hpp"
#include "whisper/engine.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

// Runs one request against a fresh engine context:
// load -> configure -> run -> extract segments, releasing the context on
// every exit path.
class TranscriptionAdapter {
public:
    using LogFn = std::function<void(const std::string&)>;

    explicit TranscriptionAdapter(SpeechEngine& engine, LogFn log = {});

    // The engine takes the sample count as an int.
    static bool sample_count_fits(size_t n);

    // Takes ownership of the samples; they are released once inference returns.
    std::expected<TranscriptionResult, Error>
        transcribe(std::vector<float> samples, const TranscriptionRequest& req);

private:
    std::expected<std::vector<Segment>, Error> extract_segments(const EngineContext& ctx);

    void log(const std::string& msg) const;

    SpeechEngine& engine_;
    LogFn log_;
};
