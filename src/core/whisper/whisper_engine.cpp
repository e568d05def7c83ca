#include "whisper_engine.hpp"

#include <print>
#include <whisper.h>

namespace {

void whisper_log_sink(ggml_log_level /*level*/, const char* text, void* /*user_data*/) {
    if (text) std::print(stderr, "{}", text);
}

void whisper_log_silent(ggml_log_level, const char*, void*) {}

class WhisperContext : public EngineContext {
public:
    explicit WhisperContext(whisper_context* ctx)
        : ctx_(ctx), params_(whisper_full_default_params(WHISPER_SAMPLING_GREEDY)) {}

    ~WhisperContext() override {
        whisper_free(ctx_);
    }

    void configure(const InferenceParams& p) override {
        params_ = whisper_full_default_params(p.greedy ? WHISPER_SAMPLING_GREEDY
                                                       : WHISPER_SAMPLING_BEAM_SEARCH);
        params_.n_threads = p.n_threads;
        params_.print_realtime = p.print_realtime;
        params_.print_progress = p.print_progress;
        params_.no_timestamps = p.no_timestamps;
    }

    bool run(std::span<const float> samples) override {
        return whisper_full(ctx_, params_, samples.data(), static_cast<int>(samples.size())) == 0;
    }

    int segment_count() const override {
        return whisper_full_n_segments(ctx_);
    }

    const char* segment_text(int index) const override {
        return whisper_full_get_segment_text(ctx_, index);
    }

private:
    whisper_context* ctx_;
    whisper_full_params params_;
};

} // namespace

WhisperEngine::WhisperEngine(bool verbose) : verbose_(verbose) {
    whisper_log_set(verbose_ ? whisper_log_sink : whisper_log_silent, nullptr);
}

WhisperEngine::~WhisperEngine() {
    // Back to whisper.cpp's default logger.
    whisper_log_set(nullptr, nullptr);
}

std::expected<std::unique_ptr<EngineContext>, std::string>
WhisperEngine::load(const std::string& model_path, bool use_gpu) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu;

    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("whisper_init_from_file_with_params failed: " + model_path);
    }
    return std::make_unique<WhisperContext>(ctx);
}
