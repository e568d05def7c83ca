#include "transcription_adapter.hpp"

#include "wav_decoder.hpp"

#include <chrono>
#include <format>
#include <limits>
#include <new>

TranscriptionAdapter::TranscriptionAdapter(SpeechEngine& engine, LogFn log)
    : engine_(engine), log_(std::move(log)) {}

bool TranscriptionAdapter::sample_count_fits(size_t n) {
    return n <= static_cast<size_t>(std::numeric_limits<int>::max());
}

std::expected<TranscriptionResult, Error>
TranscriptionAdapter::transcribe(std::vector<float> samples, const TranscriptionRequest& req) {
    if (req.n_threads <= 0) {
        return std::unexpected(Error{ErrorKind::InvalidRequest,
                                     std::format("thread count must be positive, got {}",
                                                 req.n_threads)});
    }
    if (req.model_path.empty()) {
        return std::unexpected(Error{ErrorKind::InvalidRequest, "no model path given"});
    }
    if (!sample_count_fits(samples.size())) {
        return std::unexpected(Error{ErrorKind::InvalidRequest,
                                     std::format("{} samples exceed the engine limit of {}",
                                                 samples.size(),
                                                 std::numeric_limits<int>::max())});
    }

    auto start = std::chrono::steady_clock::now();

    auto loaded = engine_.load(req.model_path, req.use_gpu);
    if (!loaded) {
        return std::unexpected(Error{ErrorKind::EngineInitFailed, loaded.error()});
    }
    // Released when this scope ends, whichever return is taken below.
    std::unique_ptr<EngineContext> ctx = std::move(*loaded);
    log(std::format("model loaded: {}", req.model_path));

    ctx->configure(InferenceParams{
        .n_threads = req.n_threads,
        .greedy = true,
        .print_realtime = false,
        .print_progress = false,
        .no_timestamps = true,
    });

    double duration_s = static_cast<double>(samples.size()) / wav::required_sample_rate;
    bool ok = ctx->run(samples);
    std::vector<float>().swap(samples);
    if (!ok) {
        return std::unexpected(Error{ErrorKind::EngineInferenceFailed,
                                     "engine failed to process audio"});
    }

    auto segments = extract_segments(*ctx);
    if (!segments) return std::unexpected(segments.error());

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();
    log(std::format("{} segments from {:.1f}s audio in {:.2f}s",
                    segments->size(), duration_s, processing_s));

    return TranscriptionResult{
        .segments = std::move(*segments),
        .duration_s = duration_s,
        .processing_s = processing_s,
    };
}

std::expected<std::vector<Segment>, Error>
TranscriptionAdapter::extract_segments(const EngineContext& ctx) {
    std::vector<Segment> segments;
    int n = ctx.segment_count();

    Error failure;
    bool failed = false;
    try {
        segments.reserve(n > 0 ? static_cast<size_t>(n) : 0);
        for (int i = 0; i < n; ++i) {
            const char* text = ctx.segment_text(i);
            if (!text) {
                failure = {ErrorKind::EngineInferenceFailed,
                           std::format("segment {} of {} has no text", i, n)};
                failed = true;
                break;
            }
            segments.push_back(Segment{.index = i, .text = text});
        }
    } catch (const std::bad_alloc&) {
        failure = {ErrorKind::OutOfMemory,
                   std::format("out of memory after copying {} of {} segments",
                               segments.size(), n)};
        failed = true;
    }

    if (failed) {
        // Drop everything copied so far; the caller gets the error only.
        segments.clear();
        segments.shrink_to_fit();
        return std::unexpected(std::move(failure));
    }
    return segments;
}

void TranscriptionAdapter::log(const std::string& msg) const {
    if (log_) log_(msg);
}
