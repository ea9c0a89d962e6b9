#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

class WordPieceTokenizer {
public:
    bool load_vocab(const std::string& vocab_path);

    // Returns token ids including [CLS] ... [SEP], truncated to max_len
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    // Lowercased words, punctuation and single CJK ideographs, before WordPiece.
    std::vector<std::string> basic_tokenize(const std::string& text) const;

    // Greedy longest-match pieces ("##" marks continuations); {"[UNK]"} when
    // the word cannot be covered.
    std::vector<std::string> wordpiece(const std::string& token) const;

    int64_t pad_id() const { return id_or(0, "[PAD]"); }
    int64_t unk_id() const { return id_or(100, "[UNK]"); }
    int64_t cls_id() const { return id_or(101, "[CLS]"); }
    int64_t sep_id() const { return id_or(102, "[SEP]"); }

    size_t vocab_size() const { return m_id_to_tok.size(); }

private:
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    static constexpr size_t kMaxCharsPerWord = 100;

    int64_t id_or(int64_t def, const std::string& tok) const;
};
