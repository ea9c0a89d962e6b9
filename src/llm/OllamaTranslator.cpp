#include "llm/OllamaTranslator.hpp"
#include "llm/ProcUtil.hpp"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace llm {

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool ensure_dir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    return !ec;
}

// very small FNV-1a hash for cache keys (deterministic, no deps)
static uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    return h;
}

static std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

std::string translation_cache_key(const std::string& model, const std::string& source_lang,
                                  const std::string& target_lang, const std::string& text) {
    std::string s = model + "\n" + source_lang + "\n" + target_lang + "\n" + text;
    return "translate_v1-" + hex_u64(fnv1a64(s));
}

std::string parse_translation_json(const std::string& s) {
    auto a = s.find('{');
    auto b = s.rfind('}');
    if (a == std::string::npos || b == std::string::npos || b <= a) return "";

    json j;
    try {
        j = json::parse(s.substr(a, b - a + 1));
    } catch (const json::exception&) {
        return "";
    }

    if (!j.is_object()) return "";
    if (!j.contains("translation") || !j["translation"].is_string()) return "";
    return j["translation"].get<std::string>();
}

OllamaTranslator::OllamaTranslator(const std::string& model, const std::string& cache_dir,
                                   const std::string& endpoint)
    : model_(model), cache_dir_(cache_dir), endpoint_(endpoint) {
    ensure_dir(cache_dir_);
}

bool OllamaTranslator::load_cache(const std::string& key, std::string& out) const {
    fs::path p = cache_dir_ / (key + ".json");
    std::ifstream f(p, std::ios::in);
    if (!f) return false;
    out = read_all(f);
    return true;
}

void OllamaTranslator::save_cache(const std::string& key, const std::string& content) const {
    fs::path p = cache_dir_ / (key + ".json");
    std::ofstream f(p, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cerr << "translate: cannot write cache " << p.string() << "\n";
        return;
    }
    f << content;
}

std::string OllamaTranslator::prompt_translate(const std::string& text, const std::string& source_lang,
                                               const std::string& target_lang) const {
    std::ostringstream p;
    p <<
R"(You are translating one line of user-facing product content.
Return ONLY valid JSON. No markdown. No commentary.

Output schema:
{"translation":"..."}

Rules:
- Translate faithfully; do not summarize or add text.
- Keep numbers, product names and placeholders unchanged.
- If the text is already in the target language, return it unchanged.

)";
    p << "Source language: " << (source_lang.empty() ? "auto-detect" : source_lang) << "\n"
      << "Target language: " << target_lang << "\n"
      << "Text:\n" << text;
    return p.str();
}

std::string OllamaTranslator::run_ollama_json(const std::string& prompt) const {
    if (!ensure_dir(cache_dir_)) return "";

    fs::path payload = cache_dir_ / "ollama_payload.tmp.json";
    fs::path resp    = cache_dir_ / "ollama_response.tmp.json";
    fs::path err     = cache_dir_ / "ollama_curl_error.tmp.txt";

    {
        std::ofstream f(payload, std::ios::out | std::ios::trunc);
        if (!f) return "";

        json body = {
            {"model", model_},
            {"prompt", prompt},
            {"stream", false},
            {"format", "json"},
            {"options", {{"temperature", 0}, {"num_predict", 1024}}},
        };
        f << body.dump();
    }

    // write response to file (avoid pipe / quoting issues)
    std::ostringstream cmd;
    cmd << "curl -s "
        << "-o " << procutil::shell_quote(resp.string()) << " "
        << procutil::shell_quote(endpoint_) << " "
        << "-H 'Content-Type: application/json' "
        << "--data-binary " << procutil::shell_quote("@" + payload.string()) << " "
        << "2> " << procutil::shell_quote(err.string());

    int code = procutil::run_wait_exitcode(cmd.str());
    if (code != 0) {
        std::cerr << "translate: curl exited with " << code << " (see " << err.string() << ")\n";
        return "";
    }

    std::ifstream rf(resp, std::ios::in);
    if (!rf) return "";
    std::string out = read_all(rf);
    if (out.empty()) return "";

    try {
        auto j = json::parse(out);
        if (j.contains("response") && j["response"].is_string()) {
            return j["response"].get<std::string>();
        }
    } catch (const json::exception& e) {
        std::cerr << "translate: bad server response: " << e.what() << "\n";
    }
    return "";
}

std::vector<TranslationResult> OllamaTranslator::translate_batch(const std::vector<align::ContentRecord>& rows,
                                                                 const std::string& source_lang,
                                                                 const std::string& target_lang) {
    std::vector<TranslationResult> out;
    out.reserve(rows.size());

    for (const auto& r : rows) {
        if (r.raw_text.empty()) continue;

        const std::string key = translation_cache_key(model_, source_lang, target_lang, r.raw_text);

        std::string cached;
        if (load_cache(key, cached)) {
            std::string t = parse_translation_json(cached);
            if (!t.empty()) {
                out.push_back({r.id, r.original_index, t});
                continue;
            }
        }

        if (cache_only_) {
            std::cerr << "translate: skipped id=" << r.id << " (not in cache)\n";
            continue;
        }

        std::string answer = run_ollama_json(prompt_translate(r.raw_text, source_lang, target_lang));
        std::string t = parse_translation_json(answer);
        if (t.empty()) {
            std::cerr << "translate: skipped id=" << r.id << " (no usable answer from " << model_ << ")\n";
            continue;
        }

        save_cache(key, answer);
        out.push_back({r.id, r.original_index, t});
    }

    return out;
}

} // namespace llm
