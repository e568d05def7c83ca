#pragma once

#include "transcription.hpp"
#include "wav_decoder.hpp"

#include <string>

struct Config {
    struct Model {
        std::string path = "ggml-base.en.bin";
        bool use_gpu = true;
    } model;

    struct Inference {
        int threads = 4;
    } inference;

    struct Audio {
        bool skip_unknown_chunks = false;
    } audio;

    struct Output {
        std::string format = "text"; // "text" or "json"
    } output;

    TranscriptionRequest request() const {
        return {.model_path = model.path, .n_threads = inference.threads, .use_gpu = model.use_gpu};
    }

    wav::DecodeOptions decode_options() const {
        return {.skip_unknown_chunks = audio.skip_unknown_chunks};
    }

    static Config load(const std::string& path);
    static Config load_default();
};
