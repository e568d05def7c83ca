#pragma once

#include <expected>
#include <memory>
#include <span>
#include <string>

struct InferenceParams {
    int n_threads = 4;
    bool greedy = true;
    bool print_realtime = false;
    bool print_progress = false;
    bool no_timestamps = true;
};

// A loaded model plus its inference state. Destroying the object releases
// the native context; an EngineContext is owned by exactly one request.
class EngineContext {
public:
    virtual ~EngineContext() = default;

    EngineContext() = default;
    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    virtual void configure(const InferenceParams& params) = 0;
    // Blocks until inference over the whole buffer finishes.
    virtual bool run(std::span<const float> samples) = 0;
    virtual int segment_count() const = 0;
    // Borrowed; valid until the context is destroyed. May be null.
    virtual const char* segment_text(int index) const = 0;
};

class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<std::unique_ptr<EngineContext>, std::string>
        load(const std::string& model_path, bool use_gpu) = 0;
};
