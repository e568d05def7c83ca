#include "config.hpp"
#include "transcriber.hpp"
#include "whisper/whisper_engine.hpp"

#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <audio.wav>", prog);
    std::println(stderr, "Input must be 16 kHz mono 16-bit PCM WAV.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -m, --model PATH          Model file (ggml format)");
    std::println(stderr, "  -t, --threads N           Worker threads");
    std::println(stderr, "      --no-gpu              Run on CPU only");
    std::println(stderr, "      --skip-unknown-chunks Accept extra chunks between fmt and data");
    std::println(stderr, "  -j, --json                Print result as JSON");
    std::println(stderr, "  -c, --config PATH         Config file path");
    std::println(stderr, "  -v, --verbose             Enable verbose logging");
    std::println(stderr, "  -h, --help                Show this help");
}

static bool check_file_exists(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        std::println(stderr, "Error: file not found: {}", path);
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string audio_path;
    std::string model_override;
    int threads_override = 0;
    bool no_gpu = false;
    bool skip_chunks = false;
    bool json_output = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--model" || arg == "-m") && i + 1 < argc) {
            model_override = argv[++i];
        } else if ((arg == "--threads" || arg == "-t") && i + 1 < argc) {
            threads_override = std::atoi(argv[++i]);
            if (threads_override <= 0) {
                std::println(stderr, "Invalid thread count: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--no-gpu") {
            no_gpu = true;
        } else if (arg == "--skip-unknown-chunks") {
            skip_chunks = true;
        } else if (arg == "--json" || arg == "-j") {
            json_output = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        } else {
            audio_path = arg;
        }
    }

    if (audio_path.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!model_override.empty()) config.model.path = model_override;
    if (threads_override > 0) config.inference.threads = threads_override;
    if (no_gpu) config.model.use_gpu = false;
    if (skip_chunks) config.audio.skip_unknown_chunks = true;
    if (json_output) config.output.format = "json";

    if (!check_file_exists(audio_path) || !check_file_exists(config.model.path)) {
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[wavscribe] model: {} ({} threads, gpu {})", config.model.path,
                     config.inference.threads, config.model.use_gpu ? "on" : "off");
        std::println(stderr, "[wavscribe] audio: {}", audio_path);
    }

    WhisperEngine engine(verbose);
    Transcriber transcriber(engine, verbose, config.decode_options());

    auto result = transcriber.transcribe_file(audio_path, config.request());
    if (!result) {
        auto& err = result.error();
        std::println(stderr, "Error: {}: {}", to_string(err.kind), err.message);
        if (err.kind == ErrorKind::UnsupportedSampleRate) {
            std::println(stderr, "Hint: convert with ffmpeg -i input -ar 16000 -ac 1 "
                                 "-c:a pcm_s16le output.wav");
        }
        return 1;
    }

    if (config.output.format == "json") {
        json out = {
            {"segments", json::array()},
            {"text", result->text()},
            {"duration", result->duration_s},
            {"processing_time", result->processing_s},
        };
        for (auto& seg : result->segments) {
            out["segments"].push_back({{"index", seg.index}, {"text", seg.text}});
        }
        std::println("{}", out.dump(2));
        return 0;
    }

    std::println("---------------- Transcription Result ----------------");
    for (auto& seg : result->segments) {
        std::println("{}", seg.text);
    }
    std::println("------------------------------------------------------");
    return 0;
}
