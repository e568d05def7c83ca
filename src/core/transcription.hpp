#pragma once

#include <string>
#include <vector>

// Per-call engine settings. Built by the caller; the adapter never mutates it.
struct TranscriptionRequest {
    std::string model_path;
    int n_threads = 4;     // must be positive
    bool use_gpu = true;   // ignored by CPU-only whisper.cpp builds
};

struct Segment {
    int index = 0;  // emission order
    std::string text;
};

struct TranscriptionResult {
    std::vector<Segment> segments;
    double duration_s = 0.0;
    double processing_s = 0.0;

    // Segments concatenated in order, outer whitespace trimmed.
    std::string text() const;
};
