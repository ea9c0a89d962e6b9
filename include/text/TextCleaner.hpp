#pragma once
#include <string>
#include <vector>

#include "align/Models.hpp"

namespace textutil {

struct CleanOptions {
    bool strip_html = true;
    bool normalize_whitespace = true;
    bool remove_special_characters = true;  // keeps letters/digits of every script
};

// Tags -> space, <script>/<style> bodies dropped, entities decoded.
std::string strip_html(const std::string& html);

// &amp; &lt; &gt; &quot; &#39; &apos; &nbsp; and numeric references.
std::string decode_entities(const std::string& s);

// Runs of whitespace (ASCII and Unicode spaces) -> one space, trimmed.
std::string collapse_whitespace(const std::string& s);

// Punctuation/symbols -> space. Letters, digits, '_' and whitespace stay.
std::string remove_special_characters(const std::string& s);

std::string clean_content(const std::string& raw, const CleanOptions& opts = {});

// Non-blank and between min_len and max_len code points.
bool is_content_valid(const std::string& clean, size_t min_len = 3, size_t max_len = 8000);

void clean_records(std::vector<align::ContentRecord>& records, const CleanOptions& opts = {});

}  // namespace textutil
