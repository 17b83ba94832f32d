#include "text/utf8.hpp"

namespace text {

namespace {
constexpr char32_t kReplacement = 0xFFFD;

bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }
}

std::u32string utf8_decode(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const unsigned char b0 = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;
        if (b0 < 0x80) { out.push_back(b0); ++i; continue; }
        else if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; min_cp = 0x80; }
        else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min_cp = 0x800; }
        else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min_cp = 0x10000; }
        else { out.push_back(kReplacement); ++i; continue; }

        if (i + len > s.size()) { out.push_back(kReplacement); ++i; continue; }
        bool ok = true;
        for (size_t k = 1; k < len; ++k) {
            const unsigned char b = static_cast<unsigned char>(s[i + k]);
            if (!is_continuation(b)) { ok = false; break; }
            cp = (cp << 6) | (b & 0x3F);
        }
        // overlong forms, surrogates and out-of-range values are malformed
        if (!ok || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string utf8_encode(const std::u32string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t c : s) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else if (c < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        } else if (c < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (c >> 12)));
            out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (c >> 18)));
            out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

char32_t fold_case(char32_t c) {
    if (c >= 'A' && c <= 'Z') return c + 0x20;
    if (c < 0xC0) return c;

    // Latin-1 Supplement: U+00C0..U+00DE except the multiplication sign
    if (c <= 0xDE) return c == 0xD7 ? c : c + 0x20;

    // Latin Extended-A: upper/lower pairs, with the parity flipping twice
    if (c >= 0x100 && c <= 0x17F) {
        if (c == 0x130) return 'i';                 // dotted capital I
        if (c == 0x178) return 0xFF;                // Y with diaeresis
        if (c == 0x131 || c == 0x138 || c == 0x149 || c == 0x17F) return c;
        if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E))
            return (c & 1) ? c + 1 : c;
        return (c & 1) ? c : c + 1;
    }

    // Greek capitals (U+03A2 is unassigned)
    if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2) return c + 0x20;

    // Cyrillic
    if (c >= 0x400 && c <= 0x40F) return c + 0x50;
    if (c >= 0x410 && c <= 0x42F) return c + 0x20;
    return c;
}

std::u32string folded(const std::string& s) {
    std::u32string out = utf8_decode(s);
    for (auto& c : out) c = fold_case(c);
    return out;
}
}
