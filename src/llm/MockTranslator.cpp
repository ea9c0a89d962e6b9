#include "llm/MockTranslator.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace llm {

MockTranslator::MockTranslator(std::map<std::string, std::string> by_id) : by_id_(std::move(by_id)) {}

MockTranslator::MockTranslator(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open translation mock file: " + path);
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(path + ": failed to parse JSON: " + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error(path + ": root must be an object");
    }

    if (j.contains("translations")) {
        const json& arr = j["translations"];
        if (!arr.is_array()) {
            throw std::runtime_error(path + ": translations must be an array");
        }
        for (size_t i = 0; i < arr.size(); ++i) {
            const json& e = arr[i];
            if (!e.is_object() || !e.contains("id") || !e.contains("text") ||
                !e["id"].is_string() || !e["text"].is_string()) {
                throw std::runtime_error(path + ": translations[" + std::to_string(i) +
                                         "] needs string fields id and text");
            }
            by_id_[e["id"].get<std::string>()] = e["text"].get<std::string>();
        }
        return;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            throw std::runtime_error(path + ": value for id " + it.key() + " must be a string");
        }
        by_id_[it.key()] = it.value().get<std::string>();
    }
}

std::vector<TranslationResult> MockTranslator::translate_batch(const std::vector<align::ContentRecord>& rows,
                                                               const std::string&,
                                                               const std::string&) {
    std::vector<TranslationResult> out;
    for (const auto& r : rows) {
        auto it = by_id_.find(r.id);
        if (it == by_id_.end()) continue;
        out.push_back({r.id, r.original_index, it->second});
    }
    return out;
}

} // namespace llm
