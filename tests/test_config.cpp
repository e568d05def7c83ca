#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ws_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.model.path == "ggml-base.en.bin");
        REQUIRE(cfg.model.use_gpu);
        REQUIRE(cfg.inference.threads == 4);
        REQUIRE_FALSE(cfg.audio.skip_unknown_chunks);
        REQUIRE(cfg.output.format == "text");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "model": { "path": "/models/ggml-small.bin", "use_gpu": false },
            "inference": { "threads": 8 },
            "audio": { "skip_unknown_chunks": true },
            "output": { "format": "json" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.path == "/models/ggml-small.bin");
        REQUIRE_FALSE(cfg.model.use_gpu);
        REQUIRE(cfg.inference.threads == 8);
        REQUIRE(cfg.audio.skip_unknown_chunks);
        REQUIRE(cfg.output.format == "json");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "inference": { "threads": 2 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.inference.threads == 2);
        // Other fields retain defaults
        REQUIRE(cfg.model.path == "ggml-base.en.bin");
        REQUIRE(cfg.model.use_gpu);
        REQUIRE(cfg.output.format == "text");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.path == "ggml-base.en.bin");
        REQUIRE(cfg.inference.threads == 4);
    }

    SECTION("WrongTypeKeepsDefaults") {
        TmpFile f(R"({ "model": { "path": "x.bin" }, "inference": { "threads": "many" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.path == "ggml-base.en.bin");
        REQUIRE(cfg.inference.threads == 4);
    }

    SECTION("UnknownOutputFormatFallsBack") {
        TmpFile f(R"({ "inference": { "threads": 6 }, "output": { "format": "JSON" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.format == "text");
        REQUIRE(cfg.inference.threads == 6);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ws_test_nonexistent_config_file.json");
        REQUIRE(cfg.inference.threads == 4);
    }

    SECTION("BuildsRequestAndDecodeOptions") {
        Config cfg;
        cfg.model.path = "m.bin";
        cfg.inference.threads = 3;
        cfg.model.use_gpu = false;
        cfg.audio.skip_unknown_chunks = true;

        auto req = cfg.request();
        REQUIRE(req.model_path == "m.bin");
        REQUIRE(req.n_threads == 3);
        REQUIRE_FALSE(req.use_gpu);
        REQUIRE(cfg.decode_options().skip_unknown_chunks);
    }

    SECTION("LoadDefaultFromXdgConfigHome") {
        auto dir = std::filesystem::temp_directory_path() /
                   ("ws_test_xdg_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir / "wavscribe");
        {
            TmpFile src(R"({ "inference": { "threads": 12 } })");
            std::filesystem::copy_file(src.path, dir / "wavscribe" / "config.json");
        }
        setenv("XDG_CONFIG_HOME", dir.c_str(), 1);

        auto cfg = Config::load_default();
        REQUIRE(cfg.inference.threads == 12);

        unsetenv("XDG_CONFIG_HOME");
        std::filesystem::remove_all(dir);
    }
}
