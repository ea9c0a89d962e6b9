#include "text/Utf8.hpp"

namespace textutil {

uint32_t next_code_point(const std::string& s, size_t& i) {
    const unsigned char c0 = static_cast<unsigned char>(s[i]);

    size_t len = 0;
    uint32_t cp = 0;
    if (c0 < 0x80) { ++i; return c0; }
    else if ((c0 & 0xE0) == 0xC0) { len = 2; cp = c0 & 0x1F; }
    else if ((c0 & 0xF0) == 0xE0) { len = 3; cp = c0 & 0x0F; }
    else if ((c0 & 0xF8) == 0xF0) { len = 4; cp = c0 & 0x07; }
    else { ++i; return 0xFFFD; }

    if (i + len > s.size()) { ++i; return 0xFFFD; }

    for (size_t k = 1; k < len; ++k) {
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) { ++i; return 0xFFFD; }
        cp = (cp << 6) | (c & 0x3F);
    }

    i += len;
    return cp;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        append_utf8(out, 0xFFFD);
    }
}

size_t code_point_count(const std::string& s) {
    size_t n = 0;
    size_t i = 0;
    while (i < s.size()) {
        next_code_point(s, i);
        ++n;
    }
    return n;
}

bool is_cjk(uint32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) ||   // CJK unified ideographs
           (cp >= 0x3400 && cp <= 0x4DBF) ||   // extension A
           (cp >= 0xF900 && cp <= 0xFAFF) ||   // compatibility ideographs
           (cp >= 0x20000 && cp <= 0x2FA1F) ||
           (cp >= 0x3040 && cp <= 0x30FF) ||   // hiragana, katakana
           (cp >= 0xAC00 && cp <= 0xD7AF);     // hangul syllables
}

bool is_symbol_or_punct(uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= 33 && cp <= 47) || (cp >= 58 && cp <= 64) ||
               (cp >= 91 && cp <= 96 && cp != '_') || (cp >= 123 && cp <= 126);
    }
    return (cp >= 0x00A1 && cp <= 0x00BF) ||
           cp == 0x00D7 || cp == 0x00F7 ||
           (cp >= 0x2010 && cp <= 0x2027) ||   // dashes, quotes, bullets
           (cp >= 0x2030 && cp <= 0x205E) ||
           (cp >= 0x20A0 && cp <= 0x20CF) ||   // currency
           (cp >= 0x2100 && cp <= 0x214F) ||   // letterlike symbols
           (cp >= 0x2190 && cp <= 0x2BFF) ||   // arrows, math, boxes, misc symbols
           (cp >= 0x3001 && cp <= 0x3003) ||   // ideographic comma, full stop
           (cp >= 0x3008 && cp <= 0x3011) ||   // CJK brackets
           (cp >= 0x3014 && cp <= 0x301F) ||
           (cp >= 0xFE30 && cp <= 0xFE4F) ||
           (cp >= 0xFF01 && cp <= 0xFF0F) ||   // fullwidth punctuation
           (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40 && cp != 0xFF3F) ||
           (cp >= 0xFF5B && cp <= 0xFF65) ||
           (cp >= 0x1F000 && cp <= 0x1FAFF) || // emoji and pictographs
           cp == 0xFFFD;
}

bool is_unicode_space(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v' ||
           cp == 0x00A0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200B) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000 ||
           cp == 0xFEFF;
}

}  // namespace textutil
