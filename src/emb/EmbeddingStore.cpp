#include "emb/EmbeddingStore.hpp"
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

static const char kMagic[4] = {'C', 'A', 'E', 'M'};
static const uint32_t kVersion = 1;

void EmbeddingStore::set_from(const std::vector<align::ContentRecord>& records) {
    std::vector<Row> rows;
    size_t dim = 0;

    for (const auto& r : records) {
        if (!r.has_embedding()) continue;
        const auto& v = *r.embedding;
        if (dim == 0) dim = v.size();
        else if (v.size() != dim) {
            throw std::invalid_argument("embedding store: id=" + r.id + " has dimension "
                                        + std::to_string(v.size()) + ", expected " + std::to_string(dim));
        }
        rows.push_back({r.original_index, r.id, v});
    }

    m_dim = dim;
    m_rows = std::move(rows);
}

void EmbeddingStore::save(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("failed to open embedding store for writing: " + path);

    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_rows.size();
    out.write(kMagic, sizeof(kMagic));
    out.write((const char*)&kVersion, sizeof(kVersion));
    out.write((const char*)&dim, sizeof(dim));
    out.write((const char*)&n, sizeof(n));

    for (const auto& row : m_rows) {
        int32_t idx = (int32_t)row.original_index;
        uint32_t len = (uint32_t)row.id.size();
        out.write((const char*)&idx, sizeof(idx));
        out.write((const char*)&len, sizeof(len));
        out.write(row.id.data(), len);
        out.write((const char*)row.vec.data(), (std::streamsize)(sizeof(float) * row.vec.size()));
    }

    if (!out) throw std::runtime_error("failed to write embedding store: " + path);
}

void EmbeddingStore::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open embedding store: " + path);

    char magic[4] = {};
    uint32_t version = 0, dim = 0, n = 0;
    in.read(magic, sizeof(magic));
    in.read((char*)&version, sizeof(version));
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw std::runtime_error("not an embedding store: " + path);
    }
    if (version != kVersion) {
        throw std::runtime_error("unsupported embedding store version " + std::to_string(version) + ": " + path);
    }
    if (dim == 0 && n > 0) {
        throw std::runtime_error("embedding store has rows but zero dimension: " + path);
    }

    // every size read below is checked against the bytes left in the file
    const uint64_t header_bytes = sizeof(kMagic) + 3 * sizeof(uint32_t);
    const uint64_t file_bytes = std::filesystem::file_size(path);
    uint64_t remaining = file_bytes >= header_bytes ? file_bytes - header_bytes : 0;
    const uint64_t vec_bytes = sizeof(float) * (uint64_t)dim;
    const uint64_t min_row_bytes = sizeof(int32_t) + sizeof(uint32_t) + vec_bytes;
    if ((uint64_t)n * min_row_bytes > remaining) {
        throw std::runtime_error("truncated embedding store: " + path);
    }

    std::vector<Row> rows;
    rows.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        int32_t idx = 0;
        uint32_t len = 0;
        in.read((char*)&idx, sizeof(idx));
        in.read((char*)&len, sizeof(len));
        if (!in || (uint64_t)len + min_row_bytes > remaining) {
            throw std::runtime_error("truncated embedding store: " + path);
        }
        remaining -= (uint64_t)len + min_row_bytes;

        Row row;
        row.original_index = idx;
        row.id.assign(len, '\0');
        in.read(&row.id[0], len);
        row.vec.resize(dim);
        in.read((char*)row.vec.data(), (std::streamsize)(sizeof(float) * dim));
        if (!in) throw std::runtime_error("truncated embedding store: " + path);

        rows.push_back(std::move(row));
    }

    m_dim = dim;
    m_rows = std::move(rows);
}

size_t EmbeddingStore::apply_to(std::vector<align::ContentRecord>& records) const {
    std::unordered_map<int, const Row*> by_index;
    for (const auto& row : m_rows) by_index[row.original_index] = &row;

    size_t applied = 0;
    for (auto& r : records) {
        auto it = by_index.find(r.original_index);
        if (it == by_index.end()) continue;
        if (it->second->id != r.id) {
            std::cerr << "embedding store: refused row " << r.original_index
                      << " (stored id=" << it->second->id << ", csv id=" << r.id << ")\n";
            continue;
        }
        r.embedding = it->second->vec;
        ++applied;
    }
    return applied;
}
