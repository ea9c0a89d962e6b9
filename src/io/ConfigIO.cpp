#include "io/Config.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace align {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void read_bool(const json& j, const char* key, const std::string& where, bool& dst) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    dst = j.at(key).get<bool>();
}

static void read_int(const json& j, const char* key, const std::string& where, int& dst) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    const json& v = j.at(key);
    const bool fits = v.is_number_unsigned()
        ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : (v.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
           v.get<std::int64_t>() <= std::numeric_limits<int>::max());
    if (!fits) {
        throw std::runtime_error(where + "." + std::string(key) + " is out of range");
    }
    dst = static_cast<int>(v.get<std::int64_t>());
}

static void read_double(const json& j, const char* key, const std::string& where, double& dst) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    dst = j.at(key).get<double>();
}

static void read_string(const json& j, const char* key, const std::string& where, std::string& dst) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    dst = j.at(key).get<std::string>();
}

static const json* section(const json& root, const char* key, const std::string& where) {
    if (!root.contains(key)) return nullptr;
    const json& s = root.at(key);
    require_object(s, where + "." + key);
    return &s;
}

AppConfig parse_config(const std::string& json_text, const std::string& where) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const std::exception& e) {
        throw std::runtime_error(where + ": failed to parse JSON: " + e.what());
    }
    require_object(j, where);

    AppConfig cfg;

    if (const json* m = section(j, "matching", where)) {
        const std::string w = where + ".matching";
        read_double(*m, "similarity_threshold", w, cfg.matching.similarity_threshold);
        read_int(*m, "row_limit", w, cfg.matching.row_limit);
        read_int(*m, "min_content_length", w, cfg.matching.min_content_length);
        read_int(*m, "max_content_length", w, cfg.matching.max_content_length);
    }

    if (const json* p = section(j, "preprocessing", where)) {
        const std::string w = where + ".preprocessing";
        read_bool(*p, "strip_html", w, cfg.preprocessing.strip_html);
        read_bool(*p, "normalize_whitespace", w, cfg.preprocessing.normalize_whitespace);
        read_bool(*p, "remove_special_characters", w, cfg.preprocessing.remove_special_characters);
    }

    if (const json* o = section(j, "output", where)) {
        const std::string w = where + ".output";
        read_bool(*o, "show_detailed_results", w, cfg.output.show_detailed_results);
        read_bool(*o, "export_unmatched_as_placeholder", w, cfg.output.export_unmatched_as_placeholder);
    }

    if (const json* e = section(j, "embedding", where)) {
        const std::string w = where + ".embedding";
        read_string(*e, "model", w, cfg.embedding.model);
        read_string(*e, "vocab", w, cfg.embedding.vocab);
        read_int(*e, "max_tokens", w, cfg.embedding.max_tokens);
        read_int(*e, "intra_op_threads", w, cfg.embedding.intra_op_threads);
    }

    if (const json* t = section(j, "translation", where)) {
        const std::string w = where + ".translation";
        read_bool(*t, "enabled", w, cfg.translation.enabled);
        read_string(*t, "source_lang", w, cfg.translation.source_lang);
        read_string(*t, "target_lang", w, cfg.translation.target_lang);
        read_string(*t, "model", w, cfg.translation.model);
        read_string(*t, "cache_dir", w, cfg.translation.cache_dir);
        read_string(*t, "mock_file", w, cfg.translation.mock_file);
    }

    return cfg;
}

AppConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), path);
}

std::vector<std::string> validate_config(const AppConfig& cfg) {
    std::vector<std::string> problems;

    const double t = cfg.matching.similarity_threshold;
    if (std::isnan(t) || t < 0.0 || t > 1.0) {
        problems.push_back("matching.similarity_threshold must be within [0, 1]");
    }
    if (cfg.matching.row_limit < 0) {
        problems.push_back("matching.row_limit must be >= 0");
    }
    if (cfg.matching.min_content_length < 0) {
        problems.push_back("matching.min_content_length must be >= 0");
    }
    if (cfg.matching.max_content_length < 0) {
        problems.push_back("matching.max_content_length must be >= 0");
    }
    if (cfg.matching.min_content_length > cfg.matching.max_content_length) {
        problems.push_back("matching.min_content_length must not exceed max_content_length");
    }
    if (cfg.embedding.max_tokens <= 2) {
        problems.push_back("embedding.max_tokens must be > 2");
    }
    if (cfg.embedding.intra_op_threads < 1) {
        problems.push_back("embedding.intra_op_threads must be >= 1");
    }
    return problems;
}

}  // namespace align
