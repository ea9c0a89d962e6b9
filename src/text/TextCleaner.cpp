#include "text/TextCleaner.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>

#include "text/Utf8.hpp"

namespace textutil {

static std::string to_lower_ascii(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Reads a tag name right after '<' or '</'.
static std::string tag_name_at(const std::string& s, size_t pos) {
    size_t i = pos;
    if (i < s.size() && s[i] == '/') ++i;
    size_t j = i;
    while (j < s.size() && std::isalnum(static_cast<unsigned char>(s[j]))) ++j;
    return to_lower_ascii(s.substr(i, j - i));
}

std::string strip_html(const std::string& html) {
    std::string out;
    out.reserve(html.size());

    size_t i = 0;
    while (i < html.size()) {
        const char c = html[i];
        if (c != '<') {
            out.push_back(c);
            ++i;
            continue;
        }

        // a '<' not followed by a tag start is literal text ("a < b")
        const char n = (i + 1 < html.size()) ? html[i + 1] : '\0';
        const bool looks_like_tag = std::isalpha(static_cast<unsigned char>(n)) || n == '/' || n == '!' || n == '?';
        if (!looks_like_tag) {
            out.push_back(c);
            ++i;
            continue;
        }

        if (html.compare(i, 4, "<!--") == 0) {
            size_t end = html.find("-->", i + 4);
            i = (end == std::string::npos) ? html.size() : end + 3;
            out.push_back(' ');
            continue;
        }

        const std::string name = tag_name_at(html, i + 1);
        size_t end = html.find('>', i + 1);
        if (end == std::string::npos) {
            // unterminated tag: drop the rest
            out.push_back(' ');
            break;
        }
        i = end + 1;

        if ((name == "script" || name == "style") && html[end - 1] != '/') {
            const std::string lower = to_lower_ascii(html);
            size_t close = lower.find("</" + name, i);
            if (close == std::string::npos) {
                i = html.size();
            } else {
                size_t close_end = html.find('>', close);
                i = (close_end == std::string::npos) ? html.size() : close_end + 1;
            }
        }

        out.push_back(' ');
    }

    return decode_entities(out);
}

std::string decode_entities(const std::string& s) {
    static const std::unordered_map<std::string, uint32_t> named = {
        {"nbsp", 0x20}, {"amp", '&'}, {"lt", '<'}, {"gt", '>'},
        {"quot", '"'}, {"apos", '\''}, {"ndash", 0x2013}, {"mdash", 0x2014},
        {"hellip", 0x2026}, {"copy", 0xA9}, {"reg", 0xAE}, {"trade", 0x2122},
    };

    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '&') {
            out.push_back(s[i++]);
            continue;
        }

        size_t semi = s.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back(s[i++]);
            continue;
        }

        const std::string body = s.substr(i + 1, semi - i - 1);
        uint32_t cp = 0;
        bool ok = false;

        if (body.size() > 1 && body[0] == '#') {
            const bool hex = (body[1] == 'x' || body[1] == 'X');
            const std::string digits = body.substr(hex ? 2 : 1);
            if (!digits.empty()) {
                char* endp = nullptr;
                unsigned long v = std::strtoul(digits.c_str(), &endp, hex ? 16 : 10);
                if (endp && *endp == '\0' && v > 0 && v <= 0x10FFFF) {
                    cp = static_cast<uint32_t>(v);
                    ok = true;
                }
            }
        } else {
            auto it = named.find(body);
            if (it != named.end()) {
                cp = it->second;
                ok = true;
            }
        }

        if (!ok) {
            out.push_back(s[i++]);
            continue;
        }

        append_utf8(out, cp);
        i = semi + 1;
    }

    return out;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;

    size_t i = 0;
    while (i < s.size()) {
        const size_t start = i;
        const uint32_t cp = next_code_point(s, i);
        if (is_unicode_space(cp)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.append(s, start, i - start);
    }
    return out;
}

std::string remove_special_characters(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const size_t start = i;
        const uint32_t cp = next_code_point(s, i);
        if (is_symbol_or_punct(cp)) out.push_back(' ');
        else out.append(s, start, i - start);
    }
    return out;
}

std::string clean_content(const std::string& raw, const CleanOptions& opts) {
    if (collapse_whitespace(raw).empty()) return "";

    std::string text = opts.strip_html ? strip_html(raw) : raw;
    if (opts.normalize_whitespace) text = collapse_whitespace(text);

    if (opts.remove_special_characters) {
        text = remove_special_characters(text);
        text = collapse_whitespace(text);
    }
    return text;
}

bool is_content_valid(const std::string& clean, size_t min_len, size_t max_len) {
    if (collapse_whitespace(clean).empty()) return false;
    const size_t n = code_point_count(clean);
    return n >= min_len && n <= max_len;
}

void clean_records(std::vector<align::ContentRecord>& records, const CleanOptions& opts) {
    for (auto& r : records) r.clean_text = clean_content(r.raw_text, opts);
}

}  // namespace textutil
