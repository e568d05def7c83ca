#include "transcription.hpp"

std::string TranscriptionResult::text() const {
    std::string out;
    for (auto& seg : segments) {
        out += seg.text;
    }

    auto start_pos = out.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = out.find_last_not_of(" \t\n\r");
    return out.substr(start_pos, end_pos - start_pos + 1);
}
