#include "transcriber.hpp"

#include <format>
#include <print>

Transcriber::Transcriber(SpeechEngine& engine, bool verbose, wav::DecodeOptions decode_opts)
    : verbose_(verbose), decode_opts_(decode_opts),
      adapter_(engine, [this](const std::string& msg) { log(msg); }) {}

std::expected<TranscriptionResult, Error>
Transcriber::transcribe_file(const std::string& path, const TranscriptionRequest& req) {
    auto samples = wav::read_file(path, decode_opts_);
    if (!samples) {
        log(std::format("decode failed for {}: {}", path, samples.error().message));
        return std::unexpected(samples.error());
    }

    log(std::format("decoded {}: {} samples", path, samples->size()));
    return adapter_.transcribe(std::move(*samples), req);
}

std::expected<TranscriptionResult, Error>
Transcriber::transcribe_file(const std::string& path, const std::string& model_path,
                             int n_threads, bool use_gpu) {
    return transcribe_file(path, TranscriptionRequest{
        .model_path = model_path,
        .n_threads = n_threads,
        .use_gpu = use_gpu,
    });
}

std::expected<TranscriptionResult, Error>
Transcriber::transcribe_samples(std::vector<float> samples, const TranscriptionRequest& req) {
    return adapter_.transcribe(std::move(samples), req);
}

std::expected<TranscriptionResult, Error>
Transcriber::transcribe_samples(std::vector<float> samples, const std::string& model_path,
                                int n_threads, bool use_gpu) {
    return transcribe_samples(std::move(samples), TranscriptionRequest{
        .model_path = model_path,
        .n_threads = n_threads,
        .use_gpu = use_gpu,
    });
}

void Transcriber::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[wavscribe] {}", msg);
    }
}
