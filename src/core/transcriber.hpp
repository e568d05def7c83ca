#pragma once

#include "error.hpp"
#include "transcription.hpp"
#include "transcription_adapter.hpp"
#include "wav_decoder.hpp"
#include "whisper/engine.hpp"

#include <expected>
#include <string>
#include <vector>

// Public entry points. Each call is synchronous and independent: it loads
// the model, transcribes, and releases the engine context before returning.
class Transcriber {
public:
    explicit Transcriber(SpeechEngine& engine, bool verbose = false,
                         wav::DecodeOptions decode_opts = {});

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    std::expected<TranscriptionResult, Error>
        transcribe_file(const std::string& path, const TranscriptionRequest& req);
    std::expected<TranscriptionResult, Error>
        transcribe_file(const std::string& path, const std::string& model_path,
                        int n_threads, bool use_gpu);

    // For callers that already hold 16 kHz mono samples in [-1, 1].
    std::expected<TranscriptionResult, Error>
        transcribe_samples(std::vector<float> samples, const TranscriptionRequest& req);
    std::expected<TranscriptionResult, Error>
        transcribe_samples(std::vector<float> samples, const std::string& model_path,
                           int n_threads, bool use_gpu);

private:
    void log(const std::string& msg) const;

    bool verbose_;
    wav::DecodeOptions decode_opts_;
    TranscriptionAdapter adapter_;
};
