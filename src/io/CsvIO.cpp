#include "io/CsvIO.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace align {

static std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool row_is_blank(const std::vector<std::string>& row) {
    for (const auto& f : row) {
        if (!trim(f).empty()) return false;
    }
    return true;
}

std::vector<std::vector<std::string>> parse_csv(const std::string& text) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;

    size_t i = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    bool in_quotes = false;
    bool row_started = false;

    for (; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
        case '"':
            in_quotes = true;
            row_started = true;
            break;
        case ',':
            row.push_back(field);
            field.clear();
            row_started = true;
            break;
        case '\r':
            break;
        case '\n':
            row.push_back(field);
            field.clear();
            rows.push_back(std::move(row));
            row.clear();
            row_started = false;
            break;
        default:
            field.push_back(c);
            row_started = true;
            break;
        }
    }

    if (in_quotes) {
        throw std::runtime_error("unterminated quoted field in CSV");
    }
    if (row_started || !field.empty()) {
        row.push_back(field);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<ContentRecord> read_content_csv(const std::string& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("CSV file not found: " + path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open CSV file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    std::vector<std::vector<std::string>> rows;
    try {
        rows = parse_csv(ss.str());
    } catch (const std::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    }

    if (rows.empty()) {
        throw std::runtime_error(path + ": missing header row");
    }

    int id_col = -1;
    int content_col = -1;
    const auto& header = rows.front();
    for (size_t c = 0; c < header.size(); ++c) {
        const std::string h = to_lower(trim(header[c]));
        if (h == "contentid" && id_col < 0) id_col = static_cast<int>(c);
        else if (h == "content" && content_col < 0) content_col = static_cast<int>(c);
    }
    if (id_col < 0 || content_col < 0) {
        throw std::runtime_error(path + ": header must contain ContentId and Content columns");
    }

    std::vector<ContentRecord> out;
    out.reserve(rows.size() - 1);

    int next_index = 0;
    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row_is_blank(row)) continue;

        ContentRecord rec;
        rec.id = (static_cast<size_t>(id_col) < row.size()) ? trim(row[id_col]) : "";
        rec.raw_text = (static_cast<size_t>(content_col) < row.size()) ? trim(row[content_col]) : "";
        rec.original_index = next_index++;
        out.push_back(std::move(rec));
    }

    return out;
}

std::string csv_escape(const std::string& field) {
    const bool needs_quotes = field.find_first_of(",\"\r\n") != std::string::npos
        || (!field.empty() && (field.front() == ' ' || field.back() == ' '));
    if (!needs_quotes) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

static std::ofstream open_for_write(const std::string& path) {
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("failed to open output file: " + path);
    }
    return out;
}

static std::string fmt_score(const std::optional<double>& s) {
    if (!s) return "";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << *s;
    return oss.str();
}

static std::string fmt_line(const std::optional<int>& n) {
    return n ? std::to_string(*n) : "";
}

static void write_row(std::ostream& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) out << ',';
        out << csv_escape(fields[i]);
    }
    out << "\n";
}

void write_content_csv(const std::string& path, const std::vector<ReorderedRow>& rows) {
    auto out = open_for_write(path);
    write_row(out, {"ContentId", "Content"});
    for (const auto& r : rows) {
        write_row(out, {r.id, r.content});
    }
    if (!out) {
        throw std::runtime_error("failed to write CSV: " + path);
    }
}

void write_aligned_csv(const std::string& path, const std::vector<DisplayRow>& rows) {
    auto out = open_for_write(path);
    write_row(out, {"RefLine", "RefContent", "TargetLine", "ContentId", "Content",
                    "TranslatedContent", "Status", "SimilarityScore", "Quality", "RowType"});

    for (const auto& r : rows) {
        const bool has_quality = r.score.has_value();
        write_row(out, {
            fmt_line(r.ref_line),
            r.ref_content,
            fmt_line(r.target_line),
            r.target_id,
            r.target_content,
            r.translated_content,
            r.status,
            fmt_score(r.score),
            has_quality ? quality_str(r.quality) : "",
            row_type_str(r.type),
        });
    }
    if (!out) {
        throw std::runtime_error("failed to write CSV: " + path);
    }
}

void write_line_by_line_csv(const std::string& path, const std::vector<LineDiagnostic>& diagnostics) {
    auto out = open_for_write(path);
    write_row(out, {"TargetLine", "ContentId", "Content", "RefLine", "RefContent", "LineScore",
                    "Quality", "Status", "SuggestedRefLine", "SuggestedRefContent", "SuggestedScore"});

    for (const auto& d : diagnostics) {
        std::string status;
        if (!d.reference) status = "Extra Target";
        else if (d.is_good) status = "Good";
        else if (d.suggestion) status = "Review";
        else status = "Poor";

        std::string sug_line, sug_content, sug_score;
        if (d.suggestion) {
            sug_line = std::to_string(d.suggestion->reference_index + 1);
            sug_content = d.suggestion->reference_content;
            sug_score = fmt_score(d.suggestion->score);
        }

        write_row(out, {
            std::to_string(d.position + 1),
            d.target.id,
            d.target.raw_text,
            d.reference ? std::to_string(d.reference->original_index + 1) : "",
            d.reference ? d.reference->raw_text : "",
            fmt_score(d.score),
            d.score ? quality_str(d.quality) : "",
            status,
            sug_line,
            sug_content,
            sug_score,
        });
    }
    if (!out) {
        throw std::runtime_error("failed to write CSV: " + path);
    }
}

}  // namespace align
