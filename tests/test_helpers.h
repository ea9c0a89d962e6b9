#pragma once

#include <unistd.h>

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include "align/Models.hpp"

namespace test_helpers {

// Record with an embedding; pass an empty vector for "no embedding".
inline align::ContentRecord record(const std::string& id, int idx, std::vector<float> emb,
                                   const std::string& text = "") {
    align::ContentRecord r;
    r.id = id;
    r.original_index = idx;
    r.raw_text = text.empty() ? ("text " + id) : text;
    r.clean_text = r.raw_text;
    if (!emb.empty()) r.embedding = std::move(emb);
    return r;
}

// Unit vector whose cosine against [1, 0] is c.
inline std::vector<float> at_cos(double c) {
    const double s = (c >= 1.0) ? 0.0 : std::sqrt(1.0 - c * c);
    return {static_cast<float>(c), static_cast<float>(s)};
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path() /
                 ("content_align_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        const std::string p = file(name);
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    std::filesystem::path m_path;
};

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace test_helpers
