#include "wav_decoder.hpp"

#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <new>

namespace wav {

namespace {

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::array<char, 4> read_tag(const uint8_t* p) {
    std::array<char, 4> tag;
    std::memcpy(tag.data(), p, 4);
    return tag;
}

bool tag_is(const std::array<char, 4>& tag, const char* expected) {
    return std::memcmp(tag.data(), expected, 4) == 0;
}

std::string printable(const std::array<char, 4>& tag) {
    std::string out;
    for (char c : tag) {
        out += (c >= 0x20 && c < 0x7f) ? c : '?';
    }
    return out;
}

std::unexpected<Error> malformed(std::string msg) {
    return std::unexpected(Error{ErrorKind::MalformedContainer, std::move(msg)});
}

// Fields of a "fmt " chunk body, at least 16 bytes.
void read_fmt_body(const uint8_t* p, Header& h) {
    h.format = read_u16(p);
    h.channels = read_u16(p + 2);
    h.sample_rate = read_u32(p + 4);
    h.byte_rate = read_u32(p + 8);
    h.block_align = read_u16(p + 12);
    h.bits_per_sample = read_u16(p + 14);
}

struct Layout {
    Header header;
    size_t data_offset = 0;
};

std::expected<Layout, Error> canonical_layout(std::span<const uint8_t> bytes) {
    auto header = parse_header(bytes);
    if (!header) return std::unexpected(header.error());
    return Layout{*header, header_size};
}

// Chunk walk for DecodeOptions::skip_unknown_chunks.
std::expected<Layout, Error> scan_chunks(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12) {
        return malformed(std::format("stream is {} bytes, too short for a RIFF header",
                                     bytes.size()));
    }

    Layout layout;
    Header& h = layout.header;
    h.riff = read_tag(bytes.data());
    h.riff_size = read_u32(bytes.data() + 4);
    h.wave = read_tag(bytes.data() + 8);
    if (!tag_is(h.riff, "RIFF") || !tag_is(h.wave, "WAVE")) {
        return malformed("missing RIFF/WAVE magic");
    }

    bool have_fmt = false;
    uint64_t pos = 12;
    for (;;) {
        if (bytes.size() - pos < 8) {
            return malformed(have_fmt ? "no data chunk found" : "no fmt chunk found");
        }

        auto tag = read_tag(bytes.data() + pos);
        uint32_t size = read_u32(bytes.data() + pos + 4);
        uint64_t body = pos + 8;

        if (tag_is(tag, "data")) {
            if (!have_fmt) {
                return malformed("data chunk precedes fmt chunk");
            }
            h.data = tag;
            h.data_bytes = size;
            layout.data_offset = static_cast<size_t>(body);
            return layout;
        }

        if (tag_is(tag, "fmt ")) {
            if (size < 16 || bytes.size() - body < 16) {
                return malformed(std::format("fmt chunk too short ({} bytes)", size));
            }
            h.fmt = tag;
            h.fmt_size = size;
            read_fmt_body(bytes.data() + body, h);
            have_fmt = true;
        }

        // Chunk bodies are padded to an even length.
        uint64_t next = body + size + (size & 1u);
        if (next > bytes.size()) {
            return malformed(std::format("chunk '{}' overruns end of stream", printable(tag)));
        }
        pos = next;
    }
}

// Checked in order: rate, encoding, channels.
std::expected<void, Error> validate_format(const Header& h) {
    if (h.sample_rate != required_sample_rate) {
        return std::unexpected(Error{
            ErrorKind::UnsupportedSampleRate,
            std::format("input must be {} Hz, got {} Hz", required_sample_rate, h.sample_rate),
        });
    }
    if (h.format != pcm_format || h.bits_per_sample != 16) {
        return std::unexpected(Error{
            ErrorKind::UnsupportedEncoding,
            std::format("only 16-bit linear PCM is supported (format {}, {} bits)",
                        h.format, h.bits_per_sample),
        });
    }
    if (h.channels != 1) {
        return std::unexpected(Error{
            ErrorKind::UnsupportedChannelLayout,
            std::format("only mono audio is supported ({} channels)", h.channels),
        });
    }
    return {};
}

} // namespace

std::expected<Header, Error> parse_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < header_size) {
        return malformed(std::format("stream is {} bytes, header needs {}",
                                     bytes.size(), header_size));
    }

    const uint8_t* p = bytes.data();
    Header h;
    h.riff = read_tag(p);
    h.riff_size = read_u32(p + 4);
    h.wave = read_tag(p + 8);
    h.fmt = read_tag(p + 12);
    h.fmt_size = read_u32(p + 16);
    read_fmt_body(p + 20, h);
    h.data = read_tag(p + 36);
    h.data_bytes = read_u32(p + 40);

    if (!tag_is(h.riff, "RIFF") || !tag_is(h.wave, "WAVE")) {
        return malformed("missing RIFF/WAVE magic");
    }
    if (!tag_is(h.fmt, "fmt ")) {
        return malformed(std::format("expected fmt chunk at byte 12, found '{}'", printable(h.fmt)));
    }
    if (!tag_is(h.data, "data")) {
        return malformed(std::format("expected data chunk at byte 36, found '{}'",
                                     printable(h.data)));
    }
    return h;
}

std::expected<std::vector<float>, Error>
decode(std::span<const uint8_t> bytes, const DecodeOptions& opts) {
    auto layout = opts.skip_unknown_chunks ? scan_chunks(bytes) : canonical_layout(bytes);
    if (!layout) return std::unexpected(layout.error());

    const Header& h = layout->header;
    if (auto ok = validate_format(h); !ok) {
        return std::unexpected(ok.error());
    }

    size_t num_samples = h.data_bytes / 2;
    size_t available = bytes.size() - layout->data_offset;
    if (available < num_samples * 2) {
        return std::unexpected(Error{
            ErrorKind::TruncatedData,
            std::format("header declares {} data bytes, stream holds {}", h.data_bytes, available),
        });
    }

    std::vector<float> samples;
    try {
        samples.resize(num_samples);
    } catch (const std::bad_alloc&) {
        return std::unexpected(Error{
            ErrorKind::OutOfMemory,
            std::format("could not allocate {} samples", num_samples),
        });
    }

    const uint8_t* src = bytes.data() + layout->data_offset;
    for (size_t i = 0; i < num_samples; ++i) {
        auto s = static_cast<int16_t>(read_u16(src + i * 2));
        samples[i] = static_cast<float>(s) / 32768.0f;
    }

    return samples;
}

std::expected<std::vector<float>, Error>
read_file(const std::string& path, const DecodeOptions& opts) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorKind::FileUnreadable,
                                     std::format("could not open {}", path)});
    }

    std::vector<uint8_t> bytes;
    try {
        bytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    } catch (const std::bad_alloc&) {
        return std::unexpected(Error{ErrorKind::OutOfMemory,
                                     std::format("could not buffer {}", path)});
    }
    if (f.bad()) {
        return std::unexpected(Error{ErrorKind::FileUnreadable,
                                     std::format("read error on {}", path)});
    }

    return decode(bytes, opts);
}

} // namespace wav
