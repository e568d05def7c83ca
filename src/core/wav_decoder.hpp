#pragma once

#include "error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Decodes mono 16 kHz 16-bit PCM WAV data into normalized float samples,
// the input format whisper.cpp expects.
namespace wav {

constexpr size_t header_size = 44;
constexpr uint32_t required_sample_rate = 16000;
constexpr uint16_t pcm_format = 1;

struct Header {
    std::array<char, 4> riff{};
    uint32_t riff_size = 0;
    std::array<char, 4> wave{};
    std::array<char, 4> fmt{};
    uint32_t fmt_size = 0;
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint32_t byte_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 0;
    std::array<char, 4> data{};
    uint32_t data_bytes = 0;
};

struct DecodeOptions {
    // Walk the chunk list and skip chunks other than "fmt " and "data"
    // (LIST, fact, ...). Off: "data" must follow a 16-byte "fmt " chunk.
    bool skip_unknown_chunks = false;
};

// Reads the canonical 44-byte header. Only checks length and chunk magics;
// format fields are left to decode().
std::expected<Header, Error> parse_header(std::span<const uint8_t> bytes);

std::expected<std::vector<float>, Error>
    decode(std::span<const uint8_t> bytes, const DecodeOptions& opts = {});

std::expected<std::vector<float>, Error>
    read_file(const std::string& path, const DecodeOptions& opts = {});

} // namespace wav
