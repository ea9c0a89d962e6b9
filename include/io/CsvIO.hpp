#pragma once
#include <string>
#include <vector>

#include "align/DisplayRows.hpp"
#include "align/LineByLine.hpp"
#include "align/Models.hpp"

namespace align {

// RFC 4180 fields of one file, header row included. Handles quoted fields,
// doubled quotes, embedded newlines, CRLF and a leading UTF-8 BOM.
std::vector<std::vector<std::string>> parse_csv(const std::string& text);

// Needs ContentId and Content columns (any case, any position). Records get
// original_index 0,1,2,... in file order. Throws std::runtime_error.
std::vector<ContentRecord> read_content_csv(const std::string& path);

std::string csv_escape(const std::string& field);

void write_content_csv(const std::string& path, const std::vector<ReorderedRow>& rows);
void write_aligned_csv(const std::string& path, const std::vector<DisplayRow>& rows);
void write_line_by_line_csv(const std::string& path, const std::vector<LineDiagnostic>& diagnostics);

}  // namespace align
