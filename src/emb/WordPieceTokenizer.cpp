#include "emb/WordPieceTokenizer.hpp"
#include <fstream>

#include "text/Utf8.hpp"

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }
    return !m_id_to_tok.empty();
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

static bool is_control(uint32_t cp) {
    return cp == 0 || cp == 0xFFFD || (cp < 0x20 && cp != '\t' && cp != '\n' && cp != '\r') ||
           (cp >= 0x7F && cp < 0xA0);
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;

    std::string cur;
    auto flush = [&](){
        if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    };

    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = textutil::next_code_point(text, i);

        if (is_control(cp)) continue;

        if (textutil::is_unicode_space(cp)) {
            flush();
        } else if (textutil::is_cjk(cp) || textutil::is_symbol_or_punct(cp) || cp == '_') {
            flush();
            std::string single;
            textutil::append_utf8(single, cp);
            out.push_back(single);
        } else {
            if (cp >= 'A' && cp <= 'Z') cp = cp - 'A' + 'a';
            textutil::append_utf8(cur, cp);
        }
    }
    flush();
    return out;
}

std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& token) const {
    if (token.empty()) return {"[UNK]"};

    // byte offsets of code point starts, plus the end
    std::vector<size_t> bounds;
    size_t i = 0;
    while (i < token.size()) {
        bounds.push_back(i);
        textutil::next_code_point(token, i);
    }
    bounds.push_back(token.size());

    if (bounds.size() - 1 > kMaxCharsPerWord) return {"[UNK]"};

    std::vector<std::string> pieces;
    size_t start = 0;  // index into bounds

    while (start + 1 < bounds.size()) {
        size_t end = bounds.size() - 1;
        std::string best;

        while (end > start) {
            std::string sub = token.substr(bounds[start], bounds[end] - bounds[start]);
            if (start > 0) sub = "##" + sub;

            if (m_tok_to_id.find(sub) != m_tok_to_id.end()) {
                best = sub;
                break;
            }
            --end;
        }

        if (best.empty()) return {"[UNK]"};
        pieces.push_back(best);
        start = end;
    }

    return pieces;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    int64_t cls = cls_id(), sep = sep_id(), unk = unk_id();
    if (max_len < 2) max_len = 2;

    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(cls);

    auto basic = basic_tokenize(text);
    for (const auto& t : basic) {
        auto pieces = wordpiece(t);
        for (const auto& p : pieces) {
            if (ids.size() + 1 >= max_len) break; // keep room for [SEP]
            ids.push_back(id_or(unk, p));
        }
        if (ids.size() + 1 >= max_len) break;
    }

    ids.push_back(sep);
    return ids;
}
