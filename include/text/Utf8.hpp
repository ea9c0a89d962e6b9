#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace textutil {

// Decodes one code point starting at s[i] and advances i. Malformed bytes
// decode to U+FFFD and consume a single byte.
uint32_t next_code_point(const std::string& s, size_t& i);

void append_utf8(std::string& out, uint32_t cp);

size_t code_point_count(const std::string& s);

// CJK ideographs, kana and Hangul syllables: scripts without spaces
// between words.
bool is_cjk(uint32_t cp);

// Unicode punctuation and symbol blocks we strip during normalization.
bool is_symbol_or_punct(uint32_t cp);

bool is_unicode_space(uint32_t cp);

}  // namespace textutil
