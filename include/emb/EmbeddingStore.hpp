#pragma once
#include <string>
#include <vector>

#include "align/Models.hpp"

// Per-record embeddings saved by `embed` and reloaded by `align`/`lines`.
// Rows are keyed by original_index; the id is kept to catch a store
// that belongs to a different CSV.
//
// File layout, all integers and floats little-endian (written in host
// order, so stores are only portable between little-endian machines):
//   "CAEM"  u32 version  u32 dim  u32 rows
//   per row: i32 original_index  u32 id_len  id bytes  dim x f32
class EmbeddingStore {
public:
    struct Row {
        int original_index = 0;
        std::string id;
        std::vector<float> vec;
    };

    // Records without an embedding are left out. Throws std::invalid_argument
    // when stored vectors differ in length.
    void set_from(const std::vector<align::ContentRecord>& records);

    // Throws std::runtime_error on I/O failure, a bad header, or sizes that
    // run past the end of the file.
    void save(const std::string& path) const;
    void load(const std::string& path);

    // Attaches stored vectors by original_index. Rows whose id differs from
    // the record's are refused and logged. Returns the number attached.
    size_t apply_to(std::vector<align::ContentRecord>& records) const;

    size_t dim() const { return m_dim; }
    size_t size() const { return m_rows.size(); }
    const std::vector<Row>& rows() const { return m_rows; }

private:
    size_t m_dim = 0;
    std::vector<Row> m_rows;
};
