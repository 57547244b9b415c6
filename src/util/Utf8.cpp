#include "util/Utf8.hpp"

namespace blamer {

namespace Utf8 {

namespace {

struct Scan {
    size_t length;  // bytes consumed
    bool valid;
};

/**
 * @brief Measure the sequence starting at @p pos
 *
 * For an invalid sequence the length is the maximal subpart: the lead byte
 * plus every continuation byte that was still acceptable, minimum 1.
 */
Scan scanSequence(std::string_view s, size_t pos) {
    unsigned char b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) return {1, true};

    size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
    } else if (b0 == 0xE0) {
        need = 2;
        lo = 0xA0;  // overlong
    } else if (b0 == 0xED) {
        need = 2;
        hi = 0x9F;  // surrogates
    } else if (b0 >= 0xE1 && b0 <= 0xEF) {
        need = 2;
    } else if (b0 == 0xF0) {
        need = 3;
        lo = 0x90;  // overlong
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        need = 3;
    } else if (b0 == 0xF4) {
        need = 3;
        hi = 0x8F;  // above U+10FFFF
    } else {
        return {1, false};
    }

    size_t len = 1;
    for (size_t i = 0; i < need; ++i) {
        if (pos + len >= s.size()) return {len, false};
        unsigned char b = static_cast<unsigned char>(s[pos + len]);
        if (b < lo || b > hi) return {len, false};
        lo = 0x80;
        hi = 0xBF;
        ++len;
    }
    return {len, true};
}

}

std::string sanitize(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        Scan scan = scanSequence(bytes, pos);
        if (scan.valid) {
            out.append(bytes.data() + pos, scan.length);
        } else {
            out.append(REPLACEMENT);
        }
        pos += scan.length;
    }
    return out;
}

bool isValid(std::string_view bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        Scan scan = scanSequence(bytes, pos);
        if (!scan.valid) return false;
        pos += scan.length;
    }
    return true;
}

}  // namespace Utf8

}  // namespace blamer
