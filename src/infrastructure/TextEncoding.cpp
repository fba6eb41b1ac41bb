#include "infrastructure/TextEncoding.hpp"

namespace localscribe::infrastructure {

namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/** @brief Length of the well-formed sequence starting at @p pos, or 0. */
size_t SequenceLength(const std::string& s, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t remaining = s.size() - pos;

    if (lead < 0x80) return 1;

    size_t length;
    unsigned char minSecond = 0x80, maxSecond = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) minSecond = 0xA0;       // overlong
        else if (lead == 0xED) maxSecond = 0x9F;  // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) minSecond = 0x90;       // overlong
        else if (lead == 0xF4) maxSecond = 0x8F;  // above U+10FFFF
    } else {
        return 0;
    }

    if (remaining < length) return 0;
    unsigned char second = static_cast<unsigned char>(s[pos + 1]);
    if (second < minSecond || second > maxSecond) return 0;
    for (size_t i = 2; i < length; ++i) {
        if (!IsContinuation(static_cast<unsigned char>(s[pos + i]))) return 0;
    }
    return length;
}

} // namespace

std::string TextEncoding::ToValidUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t length = SequenceLength(bytes, pos);
        if (length == 0) {
            out += kReplacement;
            ++pos;
        } else {
            out.append(bytes, pos, length);
            pos += length;
        }
    }
    return out;
}

} // namespace localscribe::infrastructure
