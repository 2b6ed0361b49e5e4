#include "utf8.h"

namespace {

bool isContinuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

/**
 * Width of the sequence announced by a lead byte, or 0 if the byte cannot
 * start a sequence (continuation bytes, 0xC0/0xC1 overlongs, 0xF5 and up).
 */
std::size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

} // namespace

namespace Utf8 {

std::optional<std::size_t> validate(std::string_view bytes) {
    std::size_t pos = 0;
    const std::size_t size = bytes.size();

    while (pos < size) {
        auto lead = static_cast<unsigned char>(bytes[pos]);

        // Fast path for ASCII runs
        if (lead < 0x80) {
            ++pos;
            continue;
        }

        std::size_t width = sequenceLength(lead);
        if (width == 0 || pos + width > size) {
            return pos;
        }

        auto second = static_cast<unsigned char>(bytes[pos + 1]);
        if (!isContinuation(second)) {
            return pos;
        }

        // Second-byte ranges exclude overlongs, surrogates and > U+10FFFF
        if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
            (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
            return pos;
        }

        for (std::size_t i = 2; i < width; ++i) {
            if (!isContinuation(static_cast<unsigned char>(bytes[pos + i]))) {
                return pos;
            }
        }

        pos += width;
    }

    return std::nullopt;
}

bool isBoundary(std::string_view bytes, std::size_t offset) {
    if (offset == 0 || offset >= bytes.size()) {
        return offset <= bytes.size();
    }
    return !isContinuation(static_cast<unsigned char>(bytes[offset]));
}

std::size_t length(std::string_view text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!isContinuation(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

bool isSingleScalar(std::string_view text) {
    return !text.empty() && !validate(text).has_value() && length(text) == 1;
}

} // namespace Utf8
