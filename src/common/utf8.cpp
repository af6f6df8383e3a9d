#include "common/utf8.hpp"

#include <cstring>

namespace soda {
namespace utf8 {

namespace {

const char REPLACEMENT[] = "\xEF\xBF\xBD";

// Inspects the sequence starting at p. Returns true when it is a complete,
// well-formed code point; `consumed` is the number of bytes it spans, or the
// length of the maximal invalid subpart to replace.
bool scanSequence(const unsigned char* p, std::size_t remaining, std::size_t& consumed) {
    const unsigned char lead = p[0];
    if (lead < 0x80) {
        consumed = 1;
        return true;
    }

    std::size_t length = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3; lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        length = 3;
    } else if (lead == 0xED) {
        length = 3; hi = 0x9F;
    } else if (lead == 0xF0) {
        length = 4; lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        length = 4;
    } else if (lead == 0xF4) {
        length = 4; hi = 0x8F;
    } else {
        consumed = 1;
        return false;
    }

    for (std::size_t k = 1; k < length; ++k) {
        if (k >= remaining) {
            consumed = k;
            return false;
        }
        const unsigned char b = p[k];
        const unsigned char min = (k == 1) ? lo : 0x80;
        const unsigned char max = (k == 1) ? hi : 0xBF;
        if (b < min || b > max) {
            consumed = k;
            return false;
        }
    }
    consumed = length;
    return true;
}

} // namespace

bool isValid(const std::string& text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t consumed = 0;
        if (!scanSequence(p + i, text.size() - i, consumed)) {
            return false;
        }
        i += consumed;
    }
    return true;
}

std::string toLossy(const char* data, std::size_t size) {
    std::string out;
    if (!data) return out;
    out.reserve(size);

    const auto* p = reinterpret_cast<const unsigned char*>(data);
    std::size_t i = 0;
    while (i < size) {
        std::size_t consumed = 0;
        if (scanSequence(p + i, size - i, consumed)) {
            out.append(data + i, consumed);
        } else {
            out.append(REPLACEMENT);
        }
        i += consumed;
    }
    return out;
}

std::string toLossy(const char* text) {
    if (!text) return std::string();
    return toLossy(text, std::strlen(text));
}

} // namespace utf8
} // namespace soda
