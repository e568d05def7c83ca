#pragma once

#include "engine.hpp"

struct whisper_context;

class WhisperEngine : public SpeechEngine {
public:
    // Routes whisper.cpp's own log output to stderr only when verbose.
    explicit WhisperEngine(bool verbose = false);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    std::expected<std::unique_ptr<EngineContext>, std::string>
        load(const std::string& model_path, bool use_gpu) override;

private:
    bool verbose_;
};
