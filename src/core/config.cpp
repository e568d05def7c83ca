#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    // Parse into a scratch copy so a type error halfway leaves pure defaults.
    Config parsed;
    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("path")) parsed.model.path = m["path"].get<std::string>();
            if (m.contains("use_gpu")) parsed.model.use_gpu = m["use_gpu"].get<bool>();
        }

        if (j.contains("inference")) {
            auto& i = j["inference"];
            if (i.contains("threads")) parsed.inference.threads = i["threads"].get<int>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("skip_unknown_chunks")) {
                parsed.audio.skip_unknown_chunks = a["skip_unknown_chunks"].get<bool>();
            }
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("format")) {
                auto format = o["format"].get<std::string>();
                if (format == "text" || format == "json") {
                    parsed.output.format = std::move(format);
                } else {
                    std::println(stderr, "config: unknown output format {}, using {}",
                                 format, parsed.output.format);
                }
            }
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
