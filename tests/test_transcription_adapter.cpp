#include <catch2/catch_test_macros.hpp>

#include "mock_engine.hpp"
#include "transcription_adapter.hpp"

#include <climits>
#include <cstddef>
#include <string>
#include <vector>

TEST_CASE("TranscriptionAdapter", "[adapter]") {
    MockEngine engine;
    std::vector<std::string> messages;
    TranscriptionAdapter adapter(engine, [&messages](const std::string& m) {
        messages.push_back(m);
    });
    TranscriptionRequest req{.model_path = "model.bin", .n_threads = 6, .use_gpu = false};
    std::vector<float> samples(16000, 0.25f);

    SECTION("SegmentsInEmissionOrder") {
        engine.segments = {" Hello", " world", "."};
        auto r = adapter.transcribe(samples, req);
        REQUIRE(r.has_value());
        REQUIRE(r->segments.size() == 3);
        REQUIRE(r->segments[0].index == 0);
        REQUIRE(r->segments[0].text == " Hello");
        REQUIRE(r->segments[2].index == 2);
        REQUIRE(r->segments[2].text == ".");
        REQUIRE(r->text() == "Hello world.");
        REQUIRE(r->duration_s == 1.0);
        REQUIRE(engine.log->releases == 1);
    }

    SECTION("ConfiguresGreedyWithoutTimestamps") {
        auto r = adapter.transcribe(samples, req);
        REQUIRE(r.has_value());
        REQUIRE(engine.log->model_path == "model.bin");
        REQUIRE_FALSE(engine.log->use_gpu);
        REQUIRE(engine.log->params.has_value());
        REQUIRE(engine.log->params->n_threads == 6);
        REQUIRE(engine.log->params->greedy);
        REQUIRE(engine.log->params->no_timestamps);
        REQUIRE_FALSE(engine.log->params->print_progress);
        REQUIRE_FALSE(engine.log->params->print_realtime);
        REQUIRE(engine.log->last_samples.size() == 16000);
        REQUIRE(engine.log->last_samples[0] == 0.25f);
    }

    SECTION("SilenceMayYieldNoSegments") {
        auto r = adapter.transcribe(std::vector<float>(16000, 0.0f), req);
        REQUIRE(r.has_value());
        REQUIRE(r->segments.empty());
        REQUIRE(r->text().empty());
        REQUIRE(engine.log->releases == 1);
    }

    SECTION("InitFailureNeverQueriesContext") {
        engine.fail_load = true;
        engine.segments = {"unused"};
        auto r = adapter.transcribe(samples, req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::EngineInitFailed);
        REQUIRE(engine.log->loads == 0);
        REQUIRE(engine.log->runs == 0);
        REQUIRE(engine.log->segment_queries == 0);
        REQUIRE(engine.log->releases == 0);
    }

    SECTION("InferenceFailureReleasesWithoutQuerying") {
        engine.fail_run = true;
        engine.segments = {"unused"};
        auto r = adapter.transcribe(samples, req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::EngineInferenceFailed);
        REQUIRE(engine.log->segment_queries == 0);
        REQUIRE(engine.log->releases == 1);
    }

    SECTION("NullSegmentTextRollsBack") {
        engine.segments = {"one", "two", std::nullopt, "four"};
        auto r = adapter.transcribe(samples, req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::EngineInferenceFailed);
        REQUIRE(engine.log->releases == 1);
    }

    SECTION("AllocationFailureRollsBack") {
        engine.segments = {"one", "two", "three", "four"};
        engine.throw_bad_alloc_at = 2;
        auto r = adapter.transcribe(samples, req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::OutOfMemory);
        REQUIRE(r.error().message == "out of memory after copying 2 of 4 segments");
        REQUIRE(engine.log->releases == 1);
    }

    SECTION("InvalidThreadCount") {
        req.n_threads = 0;
        auto r = adapter.transcribe(samples, req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidRequest);
        REQUIRE(engine.log->model_path.empty());
        REQUIRE(engine.log->releases == 0);
    }

    SECTION("EmptyModelPath") {
        req.model_path.clear();
        auto r = adapter.transcribe(samples, req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidRequest);
    }

    SECTION("FreshContextPerCall") {
        engine.segments = {"a"};
        REQUIRE(adapter.transcribe(samples, req).has_value());
        REQUIRE(adapter.transcribe(samples, req).has_value());
        REQUIRE(engine.log->loads == 2);
        REQUIRE(engine.log->releases == 2);
    }

    SECTION("LogsProgress") {
        REQUIRE(adapter.transcribe(samples, req).has_value());
        REQUIRE_FALSE(messages.empty());
        REQUIRE(messages.front() == "model loaded: model.bin");
    }
}

TEST_CASE("TranscriptionAdapter sample limit", "[adapter]") {
    REQUIRE(TranscriptionAdapter::sample_count_fits(0));
    REQUIRE(TranscriptionAdapter::sample_count_fits(static_cast<size_t>(INT_MAX)));
    REQUIRE_FALSE(TranscriptionAdapter::sample_count_fits(static_cast<size_t>(INT_MAX) + 1));
}
