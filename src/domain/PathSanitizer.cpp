/**
 * @file PathSanitizer.cpp
 * @brief Implementation of PathSanitizer.
 */

#include "domain/PathSanitizer.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace fieldtrack::domain {

namespace {

bool IsTrimmable(char c) {
    return c == '.' || c == ' ';
}

void TrimEdges(std::string& s) {
    size_t start = 0;
    while (start < s.size() && IsTrimmable(s[start])) ++start;
    size_t end = s.size();
    while (end > start && IsTrimmable(s[end - 1])) --end;
    s = s.substr(start, end - start);
}

// Cuts to at most maxBytes without splitting a UTF-8 sequence.
void TruncateUtf8(std::string& s, size_t maxBytes) {
    if (s.size() <= maxBytes) return;
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    s.resize(cut);
}

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

bool PathSanitizer::IsForbiddenCharacter(unsigned char c) {
    if (c < 0x20 || c == 0x7F) return true;
    switch (c) {
        case '\\': case '/': case ':': case '*': case '?':
        case '"': case '<': case '>': case '|':
            return true;
        default:
            return false;
    }
}

bool PathSanitizer::IsReservedDeviceName(const std::string& segment) {
    static const std::array<const char*, 22> kReserved = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
    };

    std::string stem = segment.substr(0, segment.find('.'));
    while (!stem.empty() && stem.back() == ' ') stem.pop_back();
    stem = ToUpper(stem);

    for (const char* name : kReserved) {
        if (stem == name) return true;
    }
    return false;
}

std::string PathSanitizer::Sanitize(const std::string& identifier) {
    std::string out;
    out.reserve(identifier.size());

    for (char ch : identifier) {
        char c = IsForbiddenCharacter(static_cast<unsigned char>(ch)) ? kPlaceholder : ch;
        // Collapsing dot runs keeps ".." out of the segment entirely.
        if (c == '.' && !out.empty() && out.back() == '.') continue;
        out.push_back(c);
    }

    TrimEdges(out);
    TruncateUtf8(out, kMaxSegmentLength);
    TrimEdges(out);

    // Checked on the final form: truncation and trimming can expose a device name.
    if (IsReservedDeviceName(out)) {
        out.insert(out.begin(), kPlaceholder);
        TruncateUtf8(out, kMaxSegmentLength);
        TrimEdges(out);
    }

    if (out.empty()) {
        return kFallbackSegment;
    }
    return out;
}

} // namespace fieldtrack::domain
